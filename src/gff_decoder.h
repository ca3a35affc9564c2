/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_GFF_DECODER_H__
#define __FEATURE_KIT_GFF_DECODER_H__

#include "decoder.h"
#include <string_view>

BEGIN_NAMESPACE_FK

// Parses column 9 into f's attributes, GFF3 (key=value;...) or GTF (key "value";...) style.
void parse_gff3_attributes(std::string_view text, feature_t& f);
void parse_gtf_attributes(std::string_view text, feature_t& f);

// Decodes one 9-column GFF3 or GTF line into a childless feature.
//
// GFF3 `ID` becomes the primary_id, `Name` the display_name and every
// `Parent` value a declared parent; all three are removed from the
// attributes. GTF records are identified by their gene_id / transcript_id:
// genes by gene_id, transcripts by transcript_id with the gene as parent,
// and everything else is parented to its transcript. Records without an
// identifier get a synthetic "<seq_id>:<start>-<end>" one.
//
// With `simplify` set, only the attributes that identify the record are
// kept (GTF gene_id and transcript_id).
feature_cluster decode_gff(std::string_view line, const decode_context& ctx, bool simplify = false);

// Builds the transcript or gene that a GTF record refers to but the file
// never declares, spanning the child. A synthesized transcript is linked to
// its gene through `grandparent` when do_gene is set.
feature_ptr synthesize_gtf_parent(const feature_t& child, const string& parent_id, string& grandparent,
								  const feature_factory& factory, bool do_gene);

// Whether a record of this GFF type survives the do_* switches.
bool keep_gff_type(std::string_view type, const build_flags& flags, bool do_gene);

bool is_gene_type(std::string_view type);
bool is_transcript_type(std::string_view type);

END_NAMESPACE_FK

#endif // __FEATURE_KIT_GFF_DECODER_H__
