// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "String.hxx"
#include "Class.hxx"

std::string
UnescapeToString(const struct escape_class &cls, std::string_view p) noexcept
{
	if (unescape_find(cls, p) == nullptr)
		return std::string{p};

	std::string result;
	result.resize(p.size());
	result.resize(cls.unescape(p, result.data()));
	return result;
}

std::string
EscapeToString(const struct escape_class &cls, std::string_view p) noexcept
{
	if (escape_find(cls, p) == nullptr)
		return std::string{p};

	std::string result;
	result.resize(cls.escape_size(p));
	result.resize(cls.escape(p, result.data()));
	return result;
}
