// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "CharUtil.hxx"

#include <string_view>

[[gnu::pure]]
constexpr bool
StringIsEqualIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size())
		return false;

	for (std::size_t i = 0; i < a.size(); ++i)
		if (ToLowerASCII(a[i]) != ToLowerASCII(b[i]))
			return false;

	return true;
}

[[gnu::pure]]
constexpr bool
StringStartsWithIgnoreCase(std::string_view haystack,
			   std::string_view needle) noexcept
{
	return haystack.size() >= needle.size() &&
		StringIsEqualIgnoreCase(haystack.substr(0, needle.size()),
					needle);
}

/**
 * Check if the given string starts with the specified prefix.  If
 * yes, then the prefix is removed from the string and true is
 * returned.
 */
constexpr bool
SkipPrefix(std::string_view &haystack, std::string_view needle) noexcept
{
	bool match = haystack.starts_with(needle);
	if (match)
		haystack.remove_prefix(needle.size());
	return match;
}

constexpr bool
RemoveSuffix(std::string_view &haystack, std::string_view needle) noexcept
{
	bool match = haystack.ends_with(needle);
	if (match)
		haystack.remove_suffix(needle.size());
	return match;
}
