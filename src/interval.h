/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_INTERVAL_H__
#define __FEATURE_KIT_INTERVAL_H__

#include "defines.h"
#include "fk_assert.h"
#include "util.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_FK
using std::string;

using pos_t = int32_t;          // Position within a coordinate system
enum class strand_t : uint8_t { // Strand index [+,-,unknown]
	neg_strand,
	pos_strand,
	unknown_strand
};

static constexpr auto neg_strand     = strand_t::neg_strand;
static constexpr auto pos_strand     = strand_t::pos_strand;
static constexpr auto unknown_strand = strand_t::unknown_strand;

/////////////////////////////////////////////////////////////////
// conversion routines
/////////////////////////////////////////////////////////////////

// Convert between pos_t and string
pos_t as_pos(std::string_view s);

// Accepts "+", "-", "." and "?" as well as the numeric forms "1", "-1", "0".
strand_t as_strand(std::string_view s);
INLINE char strand_as_char(strand_t strand)  { return strand == pos_strand ? '+' : strand == neg_strand ? '-' : '.'; }

/////////////////////////////////////////////////////////////////
// coordinate structs
/////////////////////////////////////////////////////////////////

// A span on one sequence in 0-based half-open coordinates, the native
// form of BED blocks and UCSC exon lists.
struct block_t {
	pos_t start; // 0-based
	pos_t end;   // 0-based exclusive

	INLINE pos_t size()  const { return end - start; }
	INLINE bool  empty() const { return end <= start; }
	INLINE bool  overlaps(const block_t& b) const { return start < b.end && b.start < end; }
	INLINE block_t intersect(const block_t& b) const { return { std::max(start, b.start), std::min(end, b.end) }; }
	string as_str() const;

	auto operator<=>(const block_t&) const = default;
};

using blocks_t = std::vector<block_t>;

// Total number of bases covered by a list of non-overlapping blocks.
pos_t total_size(const blocks_t& blocks);

END_NAMESPACE_FK

#endif // __FEATURE_KIT_INTERVAL_H__
