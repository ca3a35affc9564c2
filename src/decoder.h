/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_DECODER_H__
#define __FEATURE_KIT_DECODER_H__

#include "block_builder.h"
#include "feature.h"
#include "filetype.h"
#include <string>
#include <vector>

BEGIN_NAMESPACE_FK

// Everything a decoder needs to turn one line into features. Decoders
// keep no state between lines.
struct decode_context {
	filetype_t             filetype;
	build_flags            flags;
	const feature_factory& factory;
	const string&          source;   // default source_tag
	bool                   override_source{};  // source wins over a GFF source column
	bool                   do_gene{true};      // GTF: link transcripts to their gene_id
};

// What one decoded line (or line group) produces: a feature, possibly with
// children already attached, plus the hints needed to place it in a tree.
struct feature_cluster {
	feature_ptr    feature;
	vector<string> parents;    // identifiers of declared parents; empty for top-level records
	string         gene_name;  // grouping key for gene assembly
	bool           synthetic_id{};  // primary_id was generated rather than declared
};

END_NAMESPACE_FK

#endif // __FEATURE_KIT_DECODER_H__
