// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HeaderParser.hxx"
#include "Chars.hxx"
#include "util/StringCompare.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

bool
http_header_name_valid(std::string_view name) noexcept
{
	return !name.empty() &&
		std::all_of(name.begin(), name.end(), IsHttpTokenChar);
}

static constexpr bool
IsValidHeaderValueChar(char ch) noexcept
{
	return ch != '\0' && ch != '\n' && ch != '\r';
}

[[gnu::pure]]
static bool
IsValidHeaderValue(std::string_view value) noexcept
{
	return std::all_of(value.begin(), value.end(), IsValidHeaderValueChar);
}

bool
header_parse_line(HeaderList &headers, std::string_view line) noexcept
{
	auto [name, value] = Split(line, ':');

	/* tolerate whitespace between the name and the colon */
	name = StripRight(name);

	if (value.data() == nullptr ||
	    !http_header_name_valid(name) ||
	    !IsValidHeaderValue(value)) [[unlikely]]
		return false;

	headers.emplace_back(name, Strip(value));
	return true;
}

static constexpr bool
IsLineBreak(char ch) noexcept
{
	return ch == '\r' || ch == '\n';
}

HeaderList
header_parse_buffer(std::string_view src) noexcept
{
	HeaderList headers;

	while (!src.empty()) {
		const auto eol = std::find_if(src.begin(), src.end(), IsLineBreak);
		const auto line = Strip(std::string_view{src.begin(), eol});
		src = {eol, src.end()};

		/* swallow one line break (CR, LF or CRLF) */
		if (SkipPrefix(src, "\r"sv))
			SkipPrefix(src, "\n"sv);
		else
			SkipPrefix(src, "\n"sv);

		if (line.empty() || StringStartsWithIgnoreCase(line, "HTTP/"sv))
			continue;

		header_parse_line(headers, line);
	}

	return headers;
}
