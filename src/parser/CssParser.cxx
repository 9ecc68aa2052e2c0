// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CssParser.hxx"
#include "util/StringCompare.hxx"

using std::string_view_literals::operator""sv;

void
CssParseUrls(std::string_view src, CssParserHandler &handler) noexcept
{
	static constexpr auto keyword = "url("sv;

	std::size_t position = 0;
	while (position + keyword.size() < src.size()) {
		const auto rest = src.substr(position);
		if (!StringStartsWithIgnoreCase(rest, keyword)) {
			++position;
			continue;
		}

		const auto value_start = position + keyword.size();
		const auto close = src.find(')', value_start);
		if (close == src.npos)
			/* no closing parenthesis anywhere: no more
			   tokens */
			break;

		if (close == value_start) {
			/* "url()" */
			++position;
			continue;
		}

		const CssParserValue url{
			position, close + 1,
			src.substr(value_start, close - value_start),
		};
		handler.OnCssUrl(url);

		position = close + 1;
	}
}
