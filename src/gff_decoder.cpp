/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "gff_decoder.h"
#include "fk_assert.h"
#include "strutil.h"
#include "util.h"
#include <array>

BEGIN_NAMESPACE_FK

namespace {

// The nine tab-separated GFF columns.
struct gff_record {
	explicit gff_record(string_view line)
	{
		// a trailing tab leaves an empty attribute column
		int n = split_view(line, '\t', cols, int_cast<int>(size(cols)));
		FK_CHECK(n == int_cast<int>(size(cols)), malformed_line, "Expected {} tab-separated columns but found {}: \"{}\"",
				 size(cols), n, line);
	}

	string_view seqid() const noexcept { return cols[0]; }
	string_view source() const noexcept { return cols[1]; }
	string_view type() const noexcept { return cols[2]; }
	string_view attributes() const noexcept { return cols[8]; }

	string_view cols[9];
};

INLINE bool absent(string_view s) { return s.empty() || s == "."; }

string take_first(feature_t& f, string_view tag)
{
	string value(f.tag_value(tag));
	f.remove_tag(tag);
	return value;
}

constexpr std::array<const char*, 3> gene_types = { "gene", "pseudogene", "ncRNA_gene" };
constexpr std::array<const char*, 15> transcript_types = {
	"transcript", "mRNA", "ncRNA", "lnc_RNA", "lincRNA", "miRNA", "snRNA", "snoRNA", "rRNA", "tRNA",
	"scRNA", "primary_transcript", "processed_transcript", "pseudogenic_transcript", "misc_RNA",
};

template <size_t N>
bool one_of(string_view s, const std::array<const char*, N>& names)
{
	for (auto n : names)
		if (s == n)
			return true;
	return false;
}

}  // namespace

bool is_gene_type(string_view type) { return one_of(type, gene_types); }
bool is_transcript_type(string_view type) { return one_of(type, transcript_types); }

bool keep_gff_type(string_view type, const build_flags& flags, bool do_gene)
{
	if (is_gene_type(type))
		return do_gene;
	if (type == "exon")
		return flags.do_exon;
	if (type == "CDS")
		return flags.do_cds;
	if (type == "five_prime_UTR" || type == "three_prime_UTR" || type == "UTR" || type == "5UTR" || type == "3UTR")
		return flags.do_utr;
	if (type == "start_codon" || type == "stop_codon")
		return flags.do_codon;
	return true;
}

/////////////////////////////////////////////////////////////////

void parse_gff3_attributes(string_view text, feature_t& f)
{
	vector<string_view> pairs;
	vector<string_view> values;
	split_view(text, ';', pairs);
	for (auto pair : pairs) {
		pair = strip(pair);
		if (pair.empty())
			continue;
		auto eq = pair.find('=');
		FK_CHECK(eq != string_view::npos, malformed_line, "GFF3 attribute \"{}\" is not of the form key=value", pair);
		string key = url_unescape(strip(pair.substr(0, eq)));
		split_view(rstrip(pair.substr(eq + 1), ','), ',', values);
		if (values.empty())
			f.add_tag_value(key, "");
		for (auto v : values)
			f.add_tag_value(key, url_unescape(v));
	}
}

void parse_gtf_attributes(string_view text, feature_t& f)
{
	// key "value"; key value; ... where a quoted value may contain ';'
	size_t i = 0;
	const size_t n = text.size();
	auto skip_space = [&]() { while (i < n && (text[i] == ' ' || text[i] == '\t')) ++i; };
	while (i < n) {
		skip_space();
		if (i < n && text[i] == ';') {
			++i;
			continue;
		}
		if (i >= n)
			break;
		size_t key_start = i;
		while (i < n && text[i] != ' ' && text[i] != ';')
			++i;
		string key(text.substr(key_start, i - key_start));
		skip_space();
		string value;
		if (i < n && text[i] == '"') {
			size_t close = text.find('"', i + 1);
			FK_CHECK(close != string_view::npos, malformed_line, "Unterminated quote in GTF attribute \"{}\"", key);
			value = string(text.substr(i + 1, close - i - 1));
			i     = close + 1;
		} else {
			size_t value_start = i;
			while (i < n && text[i] != ';')
				++i;
			value = string(strip(text.substr(value_start, i - value_start)));
		}
		f.add_tag_value(key, std::move(value));
	}
}

/////////////////////////////////////////////////////////////////

feature_cluster decode_gff(string_view line, const decode_context& ctx, bool simplify)
{
	const bool gtf = ctx.filetype == filetype_t::gtf;
	gff_record record{ line };

	auto f         = ctx.factory.make();
	f->seq_id      = string(record.seqid());
	f->primary_tag = string(record.type());
	f->source_tag  = ctx.override_source || absent(record.source()) ? ctx.source : string(record.source());
	f->start       = as_pos(record.cols[3]);
	f->end         = as_pos(record.cols[4]);
	FK_CHECK(f->start >= 1 && f->start <= f->end, malformed_line, "Invalid coordinates {}-{}", f->start, f->end);
	if (!absent(record.cols[5]))
		f->score = as_double(record.cols[5]);
	f->strand = as_strand(record.cols[6]);
	if (!absent(record.cols[7])) {
		f->phase = as_int(record.cols[7]);
		FK_CHECK(*f->phase >= 0 && *f->phase <= 2, malformed_line, "Invalid phase \"{}\"", record.cols[7]);
	}

	feature_cluster out;
	if (!absent(record.attributes())) {
		if (gtf)
			parse_gtf_attributes(record.attributes(), *f);
		else
			parse_gff3_attributes(record.attributes(), *f);
	}

	if (gtf) {
		string gene_id(f->tag_value("gene_id"));
		string tran_id(f->tag_value("transcript_id"));
		if (is_gene_type(f->primary_tag)) {
			f->primary_id   = gene_id;
			f->display_name = string(f->tag_value("gene_name"));
		} else if (is_transcript_type(f->primary_tag)) {
			f->primary_id   = tran_id;
			f->display_name = string(f->tag_value("transcript_name"));
			if (!gene_id.empty() && ctx.do_gene)
				out.parents.push_back(gene_id);
		} else if (!tran_id.empty()) {
			out.parents.push_back(tran_id);
		} else if (!gene_id.empty() && ctx.do_gene) {
			out.parents.push_back(gene_id);
		}
		if (simplify) {
			std::erase_if(f->attributes, [](const auto& a) { return a.first != "gene_id" && a.first != "transcript_id"; });
		}
	} else {
		f->primary_id   = take_first(*f, "ID");
		f->display_name = take_first(*f, "Name");
		out.parents     = f->tag_values("Parent");
		f->remove_tag("Parent");
		if (simplify)
			f->attributes.clear();
	}

	if (f->primary_id.empty()) {
		f->primary_id   = fk::format("{}:{}-{}", f->seq_id, f->start, f->end);
		out.synthetic_id = true;
	}
	out.feature = std::move(f);
	return out;
}

feature_ptr synthesize_gtf_parent(const feature_t& child, const string& parent_id, string& grandparent,
								  const feature_factory& factory, bool do_gene)
{
	const string_view gene_id = child.tag_value("gene_id");
	const string_view tran_id = child.tag_value("transcript_id");
	const bool        is_gene = is_transcript_type(child.primary_tag) || (tran_id != parent_id && gene_id == parent_id);
	if (!is_gene && tran_id != parent_id)
		return nullptr;

	auto p        = factory.make();
	p->primary_id = parent_id;
	p->seq_id     = child.seq_id;
	p->start      = child.start;
	p->end        = child.end;
	p->strand     = child.strand;
	p->source_tag = child.source_tag;
	if (!gene_id.empty())
		p->add_tag_value("gene_id", string(gene_id));
	if (auto gene_name = child.tag_value("gene_name"); !gene_name.empty())
		p->add_tag_value("gene_name", string(gene_name));
	if (is_gene) {
		p->primary_tag  = "gene";
		p->display_name = string(child.tag_value("gene_name"));
	} else {
		p->primary_tag  = "transcript";
		p->display_name = string(child.tag_value("transcript_name"));
		p->add_tag_value("transcript_id", string(tran_id));
		if (do_gene && !gene_id.empty())
			grandparent = string(gene_id);
	}
	return p;
}

END_NAMESPACE_FK
