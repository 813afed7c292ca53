/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_INTERVAL_H__
#define __SYNTENY_KIT_INTERVAL_H__

#include "defines.h"
#include "sk_assert.h"
#include "util.h"

#include <algorithm>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <vector>

BEGIN_NAMESPACE_SK
using std::max;
using std::min;
using std::string;

using pos_t = int64_t;          // Position along a sequence, or along the shared layout axis
enum class strand_t : uint8_t { // Strand index [-,+,.]
	neg_strand,
	pos_strand,
	no_strand,
	num_strand
};

static constexpr auto neg_strand = strand_t::neg_strand;
static constexpr auto pos_strand = strand_t::pos_strand;
static constexpr auto no_strand  = strand_t::no_strand;
static constexpr auto num_strand = as_ordinal(strand_t::num_strand);

/////////////////////////////////////////////////////////////////
// conversion routines
/////////////////////////////////////////////////////////////////

pos_t as_pos(std::string_view s);

// Convert between '+'/'-'/'.' and strand_t
strand_t as_strand(char c);
strand_t as_strand(std::string_view s); // empty string is no_strand
INLINE bool is_valid_strand(strand_t strand) { return as_ordinal(strand) < num_strand; }
INLINE char strand_as_char(strand_t strand)  { SK_DBASSERT(is_valid_strand(strand)); return strand == pos_strand ? '+' : strand == neg_strand ? '-' : '.'; }

// '+' <-> '-'; unknown strand stays unknown.
INLINE strand_t opp_strand(strand_t strand)  { return strand == pos_strand ? neg_strand : strand == neg_strand ? pos_strand : strand; }

// Relative orientation of two strands; unknown behaves like '+'.
INLINE strand_t combine_strands(strand_t a, strand_t b) { return (a == neg_strand) != (b == neg_strand) ? neg_strand : pos_strand; }

/////////////////////////////////////////////////////////////////
// coordinate structs
/////////////////////////////////////////////////////////////////

// Sequence-local interval as features and links are given: 1-based, end inclusive.
struct span_t {
	pos_t start;
	pos_t end;

	INLINE pos_t size() const { return end - start + 1; }

	// Upstream is 5' of the span, i.e. to the right when strand is '-'.
	INLINE span_t expand(pos_t upstream, pos_t dnstream, strand_t strand) const
	{
		return strand == neg_strand ? span_t{start - dnstream, end + upstream} : span_t{start - upstream, end + dnstream};
	}

	INLINE bool operator==(const span_t&) const = default;
};

// Displayed part of a sequence: 0-based, end exclusive.
struct window_t {
	pos_t start;
	pos_t end;

	INLINE pos_t width() const { return end - start; }
	INLINE bool  contains(const span_t& s) const { return s.start > start && s.end <= end; }
	INLINE pos_t overlap(const span_t& s)  const { return max<pos_t>(0, min(s.end, end) - max(s.start, start + 1) + 1); }
	INLINE span_t clip(const span_t& s)    const { return span_t{max(s.start, start + 1), min(s.end, end)}; }
	INLINE window_t intersect(const window_t& w) const { return window_t{max(start, w.start), min(end, w.end)}; }

	INLINE static window_t from_span(const span_t& s) { return window_t{s.start - 1, s.end}; }

	INLINE bool operator==(const window_t&) const = default;
};

// Sorts windows and merges those that overlap or are at most max_dist apart.
std::vector<window_t> merge_windows(std::vector<window_t> windows, pos_t max_dist);

END_NAMESPACE_SK

template <>
struct fmt::formatter<sk::strand_t> : fmt::formatter<char> {
	template <typename FormatCtx>
	auto format(sk::strand_t x, FormatCtx& ctx) const
	{
		return fmt::formatter<char>::format(sk::strand_as_char(x), ctx);
	}
};

template <>
struct fmt::formatter<sk::span_t> : fmt::formatter<std::string_view> {
	template <typename FormatCtx>
	auto format(const sk::span_t& x, FormatCtx& ctx) const
	{
		return fmt::format_to(ctx.out(), "{}-{}", x.start, x.end);
	}
};

#endif // __SYNTENY_KIT_INTERVAL_H__
