/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_UCSC_DECODER_H__
#define __FEATURE_KIT_UCSC_DECODER_H__

#include "decoder.h"
#include "ucsc_tables.h"
#include <string_view>

BEGIN_NAMESPACE_FK

// Decodes one UCSC gene prediction line (genePred, refFlat, knownGene,
// genePredExt, genePredExtBin) into a transcript built by build_transcript().
// The cluster's gene_name is the key used to group transcripts into genes:
// refFlat geneName, genePredExt name2, then the side tables, then the
// transcript name itself.
feature_cluster decode_ucsc(std::string_view line, const decode_context& ctx, const ucsc_tables& tables);

END_NAMESPACE_FK

#endif // __FEATURE_KIT_UCSC_DECODER_H__
