/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_BLOCK_BUILDER_H__
#define __FEATURE_KIT_BLOCK_BUILDER_H__

#include "feature.h"
#include "interval.h"
#include <string>
#include <string_view>

BEGIN_NAMESPACE_FK

// A transcript described the way BED12 and genePred describe one: a flat
// exon list plus the coding range, all 0-based half-open.
struct transcript_blocks {
	string   name;
	string   seq_id;
	strand_t strand{unknown_strand};
	pos_t    tx_start{};
	pos_t    tx_end{};
	pos_t    cds_start{};   // cds_start == cds_end means noncoding
	pos_t    cds_end{};
	blocks_t exons;
};

// Which sub-features to decompose a transcript into.
struct build_flags {
	bool do_exon{};
	bool do_cds{};
	bool do_utr{};
	bool do_codon{};
};

// Builds a transcript feature from its exon blocks.
//
// Coding transcripts are tagged mRNA, others get noncoding_tag. Children
// are created in transcription order and numbered 5' to 3' per type
// (<name>.exon1, <name>.cds1, <name>.utr1, <name>.start_codon). When
// do_utr, do_cds and do_codon are all set, the UTR, CDS and codon children
// tile the exons exactly; codons are cut out of the CDS and may be split by
// an intron. Noncoding transcripts only ever get exon children.
//
// Throws value_error for empty or inverted exon blocks or a CDS range that
// lies outside the transcript.
feature_ptr build_transcript(const transcript_blocks& tx,
							 const build_flags& flags,
							 const feature_factory& factory,
							 const string& source,
							 std::string_view noncoding_tag = "ncRNA");

END_NAMESPACE_FK

#endif // __FEATURE_KIT_BLOCK_BUILDER_H__
