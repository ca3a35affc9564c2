/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "ucsc_decoder.h"
#include "fk_assert.h"
#include "strutil.h"
#include "util.h"

BEGIN_NAMESPACE_FK

namespace {

// Columns of the genePred core, relative to the `name` column.
//   [0] name  [1] chrom  [2] strand  [3] txStart  [4] txEnd  [5] cdsStart  [6] cdsEnd
//   [7] exonCount  [8] exonStarts  [9] exonEnds
// genePredExt continues with [10] score [11] name2 [12] cdsStartStat [13] cdsEndStat [14] exonFrames;
// knownGene with [10] proteinID [11] alignID.
enum genepred_col {
	gp_name, gp_chrom, gp_strand, gp_tx_start, gp_tx_end, gp_cds_start, gp_cds_end,
	gp_exon_count, gp_exon_starts, gp_exon_ends,
	gp_ext_score, gp_ext_name2, gp_ext_cds_start_stat, gp_ext_cds_end_stat,
	kg_protein_id = gp_ext_score, kg_align_id = gp_ext_name2,
};

// refFlat has geneName before the core; genePredExtBin has bin.
int core_offset(filetype_t ft) { return ft == filetype_t::refFlat || ft == filetype_t::genePredExtBin ? 1 : 0; }

bool has_ext_columns(filetype_t ft) { return ft == filetype_t::genePredExt || ft == filetype_t::genePredExtBin; }

vector<pos_t> as_pos_list(string_view s, int count, const char* what)
{
	vector<string_view> parts;
	split_view(rstrip(s, ','), ',', parts);
	FK_CHECK(int_cast<int>(size(parts)) == count, malformed_line, "exonCount is {} but {} lists {} values", count, what,
			 size(parts));
	vector<pos_t> out;
	out.reserve(parts.size());
	for (auto p : parts)
		out.push_back(as_pos(p));
	return out;
}

}  // namespace

feature_cluster decode_ucsc(std::string_view line, const decode_context& ctx, const ucsc_tables& tables)
{
	const filetype_t ft       = ctx.filetype;
	const int        expected = expected_columns(ft);
	vector<string_view> all;
	split_view(line, '\t', all);
	FK_CHECK(int_cast<int>(size(all)) == expected, malformed_line, "{} line has {} columns, expected {}: \"{}\"",
			 as_str(ft), size(all), expected, line);
	const string_view* cols = all.data() + core_offset(ft);

	transcript_blocks tx;
	tx.name      = string(cols[gp_name]);
	tx.seq_id    = string(cols[gp_chrom]);
	tx.strand    = as_strand(cols[gp_strand]);
	tx.tx_start  = as_pos(cols[gp_tx_start]);
	tx.tx_end    = as_pos(cols[gp_tx_end]);
	tx.cds_start = as_pos(cols[gp_cds_start]);
	tx.cds_end   = as_pos(cols[gp_cds_end]);

	const int  exon_count = as_int(cols[gp_exon_count]);
	FK_CHECK(exon_count > 0, malformed_line, "Expected positive exonCount but found {}", exon_count);
	const auto starts = as_pos_list(cols[gp_exon_starts], exon_count, "exonStarts");
	const auto ends   = as_pos_list(cols[gp_exon_ends], exon_count, "exonEnds");
	for (int i = 0; i < exon_count; ++i)
		tx.exons.push_back({ starts[i], ends[i] });

	// noncoding transcripts store cdsStart == cdsEnd
	const string noncoding = tx.cds_start < tx.cds_end ? string("ncRNA") : tables.noncoding_tag(tx.name);
	feature_ptr tran = build_transcript(tx, ctx.flags, ctx.factory, ctx.source, noncoding);

	string gene_name;
	if (ft == filetype_t::refFlat)
		gene_name = string(all[0]);
	if (ft == filetype_t::knownGene) {
		tran->add_tag_value("proteinID", string(cols[kg_protein_id]));
		tran->add_tag_value("alignID", string(cols[kg_align_id]));
	}
	if (has_ext_columns(ft)) {
		if (is_numeric(cols[gp_ext_score]))
			tran->score = as_double(cols[gp_ext_score]);
		tran->add_tag_value("cdsStartStat", string(cols[gp_ext_cds_start_stat]));
		tran->add_tag_value("cdsEndStat", string(cols[gp_ext_cds_end_stat]));
		gene_name = string(cols[gp_ext_name2]);
	}
	if (gene_name.empty())
		gene_name = tables.gene_name(tx.name);
	if (gene_name.empty())
		gene_name = tx.name;
	tables.annotate(*tran);

	return { std::move(tran), {}, std::move(gene_name) };
}

END_NAMESPACE_FK
