/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __FEATURE_KIT_STRUTIL_H__
#define __FEATURE_KIT_STRUTIL_H__

#include "defines.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

BEGIN_NAMESPACE_FK
using std::string;
using std::string_view;
using std::vector;

///////////////////////////////////////////////////

inline bool startswith(string_view s, string_view start) { return s.starts_with(start); }
inline bool endswith(string_view s, string_view end) { return s.ends_with(end); }
inline bool contains(string_view s, string_view substr) { return s.find(substr) != string::npos; }
inline string_view strip(string_view s)
{
	const auto start = std::find_if(std::begin(s), std::end(s), [](auto x) { return isspace(x) == 0; });
	s = s.substr(std::distance(std::begin(s), start));
	const auto stop  = std::find_if(std::rbegin(s), std::rend(s), [](auto x) { return isspace(x) == 0; });
	return s.substr(0, std::distance(std::begin(s), stop.base()));
}

// Drop every trailing occurrence of c, e.g. the final ',' of a UCSC exon list.
inline string_view rstrip(string_view str, char c)
{
	while (!str.empty() && str.back() == c)
		str.remove_suffix(1);
	return str;
}

INLINE char lower(char c) { return (c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c; }

inline bool iequal(string_view x, string_view y)
{
	return std::equal(std::cbegin(x), std::cend(x), std::cbegin(y), std::cend(y),
					  [](auto u, auto v) { return lower(u) == lower(v); });
}
inline bool icontains(string_view s, string_view substr)
{
	return std::search(std::cbegin(s), std::cend(s), std::cbegin(substr), std::cend(substr),
					   [](auto u, auto v) { return lower(u) == lower(v); }) != std::cend(s);
}
string to_lower(string_view s);

///////////////////////////////////////////////////

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols=0x7fffffff);
int  split_view(string_view s, char delim, string_view* out, int max_cols = 0x7fffffff);

// Decodes %XX escapes (GFF3 column 9). Malformed escapes are kept verbatim.
string url_unescape(string_view s);

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

int    as_int(string_view s);
double as_double(string_view s);

// Shape tests used when sniffing columns; none of them throw.
bool is_integer(string_view s);        // [+-]?[0-9]+
bool is_numeric(string_view s);        // anything as_double accepts
bool is_comma_integers(string_view s); // "12,40,77," (trailing comma allowed)

END_NAMESPACE_FK

#endif // __FEATURE_KIT_STRUTIL_H__
