/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "ucsc_tables.h"
#include "file.h"
#include "fk_assert.h"
#include "util.h"
#include <array>
#include <utility>

BEGIN_NAMESPACE_FK

namespace {

// Column offsets after the key column has been removed
enum kgxref_col { kg_mrna, kg_spid, kg_spdisplay, kg_symbol, kg_refseq, kg_protacc, kg_description };

constexpr std::array<const char*, 9> noncoding_biotypes = {
	"miRNA", "snoRNA", "snRNA", "rRNA", "tRNA", "lincRNA", "scaRNA", "misc_RNA", "pseudogene",
};

constexpr std::pair<const char*, const char*> description_keywords[] = {
	{ "microRNA",        "miRNA"   },
	{ "small nucleolar", "snoRNA"  },
	{ "small nuclear",   "snRNA"   },
	{ "transfer RNA",    "tRNA"    },
	{ "ribosomal RNA",   "rRNA"    },
	{ "long non-coding", "lnc_RNA" },
};

}  // namespace

ucsc_tables::ucsc_tables(const ucsc_table_paths& paths)
{
	if (!paths.refseqstat.empty())
		load(paths.refseqstat, 3, _refseqstat);
	if (!paths.refseqsum.empty())
		load(paths.refseqsum, 3, _refseqsum);
	if (!paths.kgxref.empty())
		load(paths.kgxref, 10, _kgxref);
	if (!paths.ensembltogene.empty())
		load(paths.ensembltogene, 2, _ensembltogene);
	if (!paths.ensemblsource.empty())
		load(paths.ensemblsource, 2, _ensemblsource);
}

// Rows may drop trailing empty columns; they are padded back to `width`.
void ucsc_tables::load(const string& path, size_t width, table_t& table)
{
	if (verbose_from_env())
		println("Loading UCSC table {}...", path);
	vector<string_view> cols;
	for (zline_reader lr(path); !lr.done(); ++lr) {
		auto line = lr.line();
		if (line.empty() || startswith(line, "#"))
			continue;
		try {
			split_view(line, '\t', cols);
			FK_CHECK(size(cols) >= 2, malformed_line, "Expected at least 2 columns but found {}: \"{}\"", size(cols), line);
			auto& row = table[string(cols[0])];
			row.assign(cols.begin() + 1, cols.end());
			if (row.size() < width - 1)
				row.resize(width - 1);
		}
		FK_RETHROW("In UCSC table: {}:{}", path, lr.line_num());
	}
}

const vector<string>* ucsc_tables::find(const table_t& table, string_view key)
{
	auto it = table.find(key);
	return it == table.end() ? nullptr : &it->second;
}

bool ucsc_tables::empty() const
{
	return _refseqstat.empty() && _refseqsum.empty() && _kgxref.empty() && _ensembltogene.empty() && _ensemblsource.empty();
}

string ucsc_tables::gene_name(string_view tran_id) const
{
	if (auto kg = find(_kgxref, tran_id); kg && !(*kg)[kg_symbol].empty())
		return (*kg)[kg_symbol];
	if (auto ens = find(_ensembltogene, tran_id))
		return ens->front();
	return {};
}

string ucsc_tables::noncoding_tag(string_view tran_id) const
{
	if (auto src = find(_ensemblsource, tran_id)) {
		const string& biotype = src->front();
		for (auto known : noncoding_biotypes)
			if (biotype == known)
				return biotype;
	}

	string_view description;
	if (auto kg = find(_kgxref, tran_id))
		description = (*kg)[kg_description];
	else if (auto sum = find(_refseqsum, tran_id))
		description = (*sum)[1];
	for (auto& [keyword, tag] : description_keywords)
		if (icontains(description, keyword))
			return tag;
	return "ncRNA";
}

void ucsc_tables::annotate(feature_t& tran) const
{
	const string& id = tran.primary_id;
	auto set = [&](const char* tag, const string& value) {
		if (!value.empty())
			tran.set_tag_value(tag, value);
	};
	if (auto stat = find(_refseqstat, id)) {
		set("status", (*stat)[0]);
		set("mol", (*stat)[1]);
	}
	if (auto sum = find(_refseqsum, id)) {
		set("completeness", (*sum)[0]);
		set("summary", (*sum)[1]);
	}
	if (auto kg = find(_kgxref, id)) {
		set("gene_name", (*kg)[kg_symbol]);
		set("description", (*kg)[kg_description]);
		set("refseq", (*kg)[kg_refseq]);
		set("spID", (*kg)[kg_spid]);
	}
	if (auto ens = find(_ensembltogene, id))
		set("gene_name", ens->front());
	if (auto src = find(_ensemblsource, id))
		set("biotype", src->front());
}

END_NAMESPACE_FK
