/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "strutil.h"
#include "fk_assert.h"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <iterator>
#include <string>
#include <system_error>

using namespace std;

BEGIN_NAMESPACE_FK

/////////////////////////////////////////////

string to_lower(string_view s)
{
	string out(s);
	transform(begin(out), end(out), begin(out), [](char c) { return lower(c); });
	return out;
}

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols)
{
	out.clear();
	while (!empty(s)) {
		if ((int)size(out) + 1 < max_cols) {
			auto pos = s.find(delim);
			out.push_back(s.substr(0, pos));
			if (pos != string_view::npos) {
				s.remove_prefix(pos + 1);
				if (empty(s))
					out.emplace_back();  // trailing delimiter ends with an empty field
			} else {
				break;
			}
		} else {
			out.push_back(s);
			break;
		}
	}
}

int split_view(string_view s, char delim, string_view* out, int max_cols)
{
	int n = 0;
	for (;!empty(s); ++n) {
		if (n + 1 < max_cols) {
			auto pos = s.find(delim);
			out[n] = s.substr(0, pos);
			if (pos != string_view::npos) {
				s.remove_prefix(pos + 1);
			} else {
				break;
			}
		} else {
			out[n] = s;
			break;
		}
	}
	return n + 1;
}

static int hex_digit(char c)
{
	if (c >= '0' && c <= '9') return c - '0';
	c = lower(c);
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	return -1;
}

string url_unescape(string_view s)
{
	string out;
	out.reserve(size(s));
	for (size_t i = 0; i < size(s); ++i) {
		if (s[i] == '%' && i + 2 < size(s) && hex_digit(s[i + 1]) >= 0 && hex_digit(s[i + 2]) >= 0) {
			out.push_back(scast<char>(hex_digit(s[i + 1]) * 16 + hex_digit(s[i + 2])));
			i += 2;
		} else {
			out.push_back(s[i]);
		}
	}
	return out;
}

/////////////////////////////////////////////

int as_int(string_view s)
{
	if (s.starts_with("+"))
		s.remove_prefix(1);

	int  val{};
	auto stop      = s.data() + s.size();
	auto [ptr, ec] = from_chars(s.data(), stop, val);
	if (ptr == stop && ec == errc{} && !s.empty())
		return val;

	FK_CHECK(ec != errc::result_out_of_range, value, "Overflow detected when parsing \"{}\" as integer.", s);
	FK_THROW(value, "Failed to parse \"{}\" as integer.", s);
}

double as_double(string_view str)
{
	char buf[512];
	FK_CHECK(size(buf) > size(str), value, "buffer size too small for '{}'", str);

	auto out = copy(cbegin(str), cend(str), buf);
	*out     = '\0';
	// Check that strtod uses up the entire string (to catch "1.23abc") and that the string wasn't empty.
	char* endptr;
	auto v = strtod(buf, &endptr);
	FK_CHECK(endptr != buf && *endptr == '\0', value, "Failed to parse '{}' as a number", str);
	return v;
}

bool is_integer(string_view s)
{
	if (s.starts_with("+") || s.starts_with("-"))
		s.remove_prefix(1);
	return !s.empty() && all_of(cbegin(s), cend(s), [](char c) { return c >= '0' && c <= '9'; });
}

bool is_numeric(string_view s)
{
	if (s.empty() || size(s) >= 512)
		return false;
	char buf[512];
	*copy(cbegin(s), cend(s), buf) = '\0';
	char* endptr;
	strtod(buf, &endptr);
	return endptr != buf && *endptr == '\0';
}

bool is_comma_integers(string_view s)
{
	s = rstrip(s, ',');
	if (s.empty())
		return false;
	vector<string_view> parts;
	split_view(s, ',', parts);
	return all_of(cbegin(parts), cend(parts), [](string_view p) { return is_integer(p); });
}

END_NAMESPACE_FK
