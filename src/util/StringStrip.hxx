// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CharUtil.hxx"

#include <string_view>

[[gnu::pure]]
static inline const char *
StripLeft(const char *p, const char *end) noexcept
{
	while (p < end && IsWhitespaceOrNull(*p))
		++p;
	return p;
}

[[gnu::pure]]
static inline char *
StripLeft(char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;
	return p;
}

/**
 * Remove trailing whitespace in place (null-terminated string).
 */
static inline void
StripRight(char *p) noexcept
{
	char *end = p;
	while (*end != 0)
		++end;

	while (end > p && IsWhitespaceOrNull(end[-1]))
		--end;

	*end = 0;
}

[[gnu::pure]]
constexpr std::string_view
StripLeft(std::string_view s) noexcept
{
	std::size_t i = 0;
	while (i < s.size() && IsWhitespaceOrNull(s[i]))
		++i;
	return s.substr(i);
}

[[gnu::pure]]
constexpr std::string_view
StripRight(std::string_view s) noexcept
{
	std::size_t n = s.size();
	while (n > 0 && IsWhitespaceOrNull(s[n - 1]))
		--n;
	return s.substr(0, n);
}

[[gnu::pure]]
constexpr std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
