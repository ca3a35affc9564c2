/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_BED_DECODER_H__
#define __FEATURE_KIT_BED_DECODER_H__

#include "decoder.h"
#include <string_view>

BEGIN_NAMESPACE_FK

// Decodes one BED-family data line (bed3..bed12, bedGraph, narrowPeak,
// broadPeak, gappedPeak) into a single top-level feature.
//
// Coordinates are converted from 0-based half-open to 1-based closed. The
// primary_id is always "<chrom>:<start0>-<end0>" built from the original
// coordinates, whatever the name column says; the name becomes the
// display_name. bed12 and gappedPeak lines are decomposed into children
// with build_transcript().
//
// Throws malformed_line_error if the column count does not match the
// filetype, and value_error for unparseable fields.
feature_cluster decode_bed(std::string_view line, const decode_context& ctx);

END_NAMESPACE_FK

#endif // __FEATURE_KIT_BED_DECODER_H__
