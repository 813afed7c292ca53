/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __SYNTENY_KIT_STRUTIL_H__
#define __SYNTENY_KIT_STRUTIL_H__

#include "defines.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

BEGIN_NAMESPACE_SK
using std::string;
using std::string_view;
using std::vector;

///////////////////////////////////////////////////

inline bool startswith(string_view s, string_view start) { return s.starts_with(start); }
inline bool endswith(string_view s, string_view end)     { return s.ends_with(end); }
inline string_view strip(string_view s)
{
	const auto start = std::find_if(std::begin(s), std::end(s), [](auto x) { return isspace(x) == 0; });
	s = s.substr(std::distance(std::begin(s), start));
	const auto stop  = std::find_if(std::rbegin(s), std::rend(s), [](auto x) { return isspace(x) == 0; });
	return s.substr(0, std::distance(std::begin(s), stop.base()));
}

///////////////////////////////////////////////////

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols=0x7fffffff);

struct string_hash {
	using hash_type      = std::hash<std::string_view>;
	using is_transparent = void;

	std::size_t operator()(const char* str) const noexcept { return hash_type{}(str); }
	std::size_t operator()(std::string_view str) const noexcept { return hash_type{}(str); }
	std::size_t operator()(const std::string& str) const noexcept { return hash_type{}(str); }
};

template <class Key, class T, class Allocator = std::allocator<std::pair<const Key, T>>>
using string_map = std::unordered_map<Key, T, string_hash, std::equal_to<>, Allocator>;

template <class Key, class Allocator = std::allocator<Key>>
using string_set = std::unordered_set<Key, string_hash, std::equal_to<>, Allocator>;

/////////////////////////////////////////////////////

int64_t as_int64(string_view s);
double  as_double(string_view s);

// True if s parses completely as a (possibly signed) decimal integer.
bool is_int(string_view s);

END_NAMESPACE_SK

#endif // __SYNTENY_KIT_STRUTIL_H__
