/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "bed_decoder.h"
#include "fk_assert.h"
#include "strutil.h"
#include "util.h"

BEGIN_NAMESPACE_FK

namespace {

// bed7..bed11 keep the columns they have as plain attributes
const char* const bed_extra_names[] = { "thickStart", "thickEnd", "itemRGB", "blockCount", "blockSizes" };

INLINE bool absent(string_view s) { return s.empty() || s == "."; }

vector<pos_t> as_pos_list(string_view s)
{
	vector<string_view> parts;
	split_view(rstrip(s, ','), ',', parts);
	vector<pos_t> out;
	out.reserve(parts.size());
	for (auto p : parts)
		out.push_back(as_pos(p));
	return out;
}

// Columns 7-12 of bed12 and gappedPeak as a transcript.
feature_ptr decode_blocks(const vector<string_view>& cols, pos_t start0, pos_t end0, const string& id,
						  const build_flags& flags, const decode_context& ctx)
{
	transcript_blocks tx;
	tx.name     = id;
	tx.seq_id   = string(cols[0]);
	tx.strand   = absent(cols[5]) ? unknown_strand : as_strand(cols[5]);
	tx.tx_start = start0;
	tx.tx_end   = end0;

	// An empty thick range (thickStart == thickEnd, usually both 0) means
	// the item has no thick part. A thickStart of 0 is real when thickEnd > 0.
	tx.cds_start = as_pos(cols[6]);
	tx.cds_end   = as_pos(cols[7]);
	if (tx.cds_start == tx.cds_end)
		tx.cds_start = tx.cds_end = end0;

	const int  block_count = as_int(cols[9]);
	const auto sizes       = as_pos_list(cols[10]);
	const auto starts      = as_pos_list(cols[11]);
	FK_CHECK(block_count > 0 && int_cast<int>(size(sizes)) == block_count && int_cast<int>(size(starts)) == block_count,
			 malformed_line, "blockCount {} does not match {} blockSizes and {} blockStarts", block_count, size(sizes),
			 size(starts));
	for (int i = 0; i < block_count; ++i)
		tx.exons.push_back({ start0 + starts[i], start0 + starts[i] + sizes[i] });

	return build_transcript(tx, flags, ctx.factory, ctx.source);
}

}  // namespace

feature_cluster decode_bed(std::string_view line, const decode_context& ctx)
{
	const filetype_t ft       = ctx.filetype;
	const int        expected = expected_columns(ft);
	vector<string_view> cols;
	split_view(line, '\t', cols);
	FK_CHECK(int_cast<int>(size(cols)) == expected, malformed_line, "{} line has {} columns, expected {}: \"{}\"",
			 as_str(ft), size(cols), expected, line);

	const pos_t start0 = as_pos(cols[1]);
	const pos_t end0   = as_pos(cols[2]);
	FK_CHECK(start0 >= 0 && start0 < end0, malformed_line, "Invalid interval [{},{}) in \"{}\"", start0, end0, line);
	const string id = fk::format("{}:{}-{}", cols[0], start0, end0);

	feature_ptr f;
	if (ft == filetype_t::bed12) {
		f = decode_blocks(cols, start0, end0, id, ctx.flags, ctx);
	} else if (ft == filetype_t::gappedPeak) {
		// sub-peaks are always built, and never split into CDS/UTR
		f = decode_blocks(cols, start0, end0, id, build_flags{ true, false, false, false }, ctx);
		f->primary_tag = "gappedPeak";
		for (auto& c : f->children)
			c->primary_tag = "peak";
	} else {
		f              = ctx.factory.make();
		f->primary_id  = id;
		f->seq_id      = string(cols[0]);
		f->start       = start0 + 1;
		f->end         = end0;
		f->primary_tag = ft == filetype_t::narrowPeak || ft == filetype_t::broadPeak ? "peak" : "region";
		f->source_tag  = ctx.source;
		if (expected >= 6 && !absent(cols[5]))
			f->strand = as_strand(cols[5]);
	}
	f->display_name.clear();
	if (ft == filetype_t::bedGraph) {
		f->score = as_double(cols[3]);
	} else {
		if (expected >= 4 && !absent(cols[3]))
			f->display_name = string(cols[3]);
		if (expected >= 5 && !absent(cols[4]))
			f->score = as_double(cols[4]);
	}

	switch (ft) {
	case filetype_t::narrowPeak:
		f->add_tag_value("signalValue", string(cols[6]));
		f->add_tag_value("pValue", string(cols[7]));
		f->add_tag_value("qValue", string(cols[8]));
		f->add_tag_value("peak", string(cols[9]));
		break;
	case filetype_t::broadPeak:
		f->add_tag_value("signalValue", string(cols[6]));
		f->add_tag_value("pValue", string(cols[7]));
		f->add_tag_value("qValue", string(cols[8]));
		break;
	case filetype_t::bed12:
		f->add_tag_value("itemRGB", string(cols[8]));
		break;
	case filetype_t::gappedPeak:
		f->add_tag_value("itemRGB", string(cols[8]));
		f->add_tag_value("signalValue", string(cols[12]));
		f->add_tag_value("pValue", string(cols[13]));
		f->add_tag_value("qValue", string(cols[14]));
		break;
	case filetype_t::bed7:
	case filetype_t::bed8:
	case filetype_t::bed9:
	case filetype_t::bed10:
	case filetype_t::bed11:
		for (int i = 6; i < expected; ++i)
			f->add_tag_value(bed_extra_names[i - 6], string(cols[i]));
		break;
	default:
		break;
	}

	return { std::move(f), {}, {} };
}

END_NAMESPACE_FK
