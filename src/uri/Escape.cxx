// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Escape.hxx"
#include "util/CharUtil.hxx"
#include "util/HexParse.hxx"

static constexpr bool
IsUriUnreserved(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

static constexpr char hex_digits[] = "0123456789ABCDEF";

std::string
UriEscape(std::string_view src) noexcept
{
	std::string dest;
	dest.reserve(src.size() * 3);

	for (const char ch : src) {
		if (IsUriUnreserved(ch)) {
			dest.push_back(ch);
		} else {
			const auto b = (unsigned char)ch;
			dest.push_back('%');
			dest.push_back(hex_digits[b >> 4]);
			dest.push_back(hex_digits[b & 0xf]);
		}
	}

	return dest;
}

std::string
UriUnescape(std::string_view src, bool plus_is_space) noexcept
{
	std::string dest;
	dest.reserve(src.size());

	for (std::size_t i = 0; i < src.size(); ++i) {
		const char ch = src[i];

		if (ch == '%' && i + 2 < src.size()) {
			const int hi = ParseHexDigit(src[i + 1]);
			const int lo = ParseHexDigit(src[i + 2]);
			if (hi >= 0 && lo >= 0) {
				dest.push_back(char((hi << 4) | lo));
				i += 2;
				continue;
			}
		} else if (ch == '+' && plus_is_space) {
			dest.push_back(' ');
			continue;
		}

		dest.push_back(ch);
	}

	return dest;
}
