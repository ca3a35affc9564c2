/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_FILETYPE_H__
#define __FEATURE_KIT_FILETYPE_H__

#include "defines.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

BEGIN_NAMESPACE_FK
using std::string;
using std::string_view;

// Coarse format family; selects the decoder.
enum class flavor_t : uint8_t {
	bed,
	gff,
	ucsc
};

// Exact sub-dialect; fixes the column layout.
enum class filetype_t : uint8_t {
	bed3, bed4, bed5, bed6, bed7, bed8, bed9, bed10, bed11, bed12,
	bedGraph,
	narrowPeak,
	broadPeak,
	gappedPeak,
	gff3,
	gtf,
	genePred,
	refFlat,
	knownGene,
	genePredExt,
	genePredExtBin,
};

struct file_format {
	flavor_t   flavor;
	filetype_t filetype;

	bool operator==(const file_format&) const = default;
};

flavor_t    flavor_of(filetype_t ft);
file_format as_format(filetype_t ft);
int         expected_columns(filetype_t ft);   // tab-delimited fields per data line
const char* as_str(filetype_t ft);
const char* as_str(flavor_t fl);
std::optional<filetype_t> as_filetype(string_view name);   // exact, case-insensitive name match

// True for lines that carry no record: blank lines, '#' comments and
// directives, and UCSC 'track' / 'browser' lines.
bool is_comment_line(string_view line);

// Classifies a file from its name (a trailing ".gz" is ignored) and, when
// the extension is ambiguous, from its header lines and first data line.
// Throws unrecognized_format_error if nothing matches.
file_format taste_file(const string& path);

// Classifies one data line on its own. `only` restricts the candidates to
// one family, as a file extension does. Returns nullopt if no dialect fits.
std::optional<file_format> taste_line(string_view line, std::optional<flavor_t> only = std::nullopt);

END_NAMESPACE_FK

#endif // __FEATURE_KIT_FILETYPE_H__
