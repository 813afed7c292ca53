/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "strutil.h"
#include "sk_assert.h"
#include <charconv>
#include <cstdlib>
#include <system_error>

using namespace std;

BEGIN_NAMESPACE_SK

/////////////////////////////////////////////

void split_view(string_view s, char delim, vector<string_view>& out, int max_cols)
{
	out.clear();
	for (;;) {
		if ((int)size(out) + 1 >= max_cols) {
			out.push_back(s);
			return;
		}
		auto pos = s.find(delim);
		out.push_back(s.substr(0, pos));
		if (pos == string_view::npos)
			return;
		s.remove_prefix(pos + 1);
	}
}

template <class T>
T as_number(string_view s, const char* type_name)
{
	if (s.starts_with("+"))
		s.remove_prefix(1);

	T    val{};
	auto stop      = s.data() + s.size();
	auto [ptr, ec] = from_chars(s.data(), stop, val);
	if (ptr == stop && ec == errc{})
		return val;

	SK_CHECK(ec != errc::result_out_of_range, value, "Overflow detected when parsing \"{}\" as {}.", s,
			 type_name);
	SK_THROW(value, "Failed to parse \"{}\" as {}.", s, type_name);
}

int64_t as_int64(string_view s) { return as_number<int64_t>(s, "integer"); }

double as_double(string_view str)
{
	// strtod needs a NUL-terminated copy; check it consumes the whole string (to catch "1.23abc").
	string buf{str};
	char* endptr;
	auto v = strtod(buf.c_str(), &endptr);
	SK_CHECK(!buf.empty() && *endptr == '\0', value, "Failed to parse \"{}\" as double.", buf);
	return v;
}

bool is_int(string_view s)
{
	if (s.starts_with("+") || s.starts_with("-"))
		s.remove_prefix(1);
	return !s.empty() && all_of(begin(s), end(s), [](char c) { return c >= '0' && c <= '9'; });
}

END_NAMESPACE_SK
