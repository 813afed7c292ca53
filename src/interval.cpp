/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "interval.h"

#include "strutil.h"
#include <algorithm>
#include <vector>

BEGIN_NAMESPACE_SK

pos_t as_pos(std::string_view s) { return as_int64(strip(s)); }

strand_t as_strand(char c)
{
	switch (c) {
	case '+': return pos_strand;
	case '-': return neg_strand;
	case '.': return no_strand;
	}
	SK_THROW(value, "Expected strand to be '+', '-' or '.' but found '{}'.", c);
}

strand_t as_strand(std::string_view s)
{
	s = strip(s);
	if (s.empty())
		return no_strand;
	SK_CHECK(s.size() == 1, value, "Expected strand string \"{}\" to be \"+\", \"-\" or \".\".", s);
	return as_strand(s[0]);
}

std::vector<window_t> merge_windows(std::vector<window_t> windows, pos_t max_dist)
{
	std::sort(begin(windows), end(windows), [](const window_t& a, const window_t& b) {
		return a.start != b.start ? a.start < b.start : a.end < b.end;
	});
	std::vector<window_t> merged;
	for (const auto& w : windows) {
		if (!merged.empty() && w.start - merged.back().end <= max_dist)
			merged.back().end = max(merged.back().end, w.end);
		else
			merged.push_back(w);
	}
	return merged;
}

END_NAMESPACE_SK
