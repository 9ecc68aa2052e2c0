// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HTML.hxx"
#include "Class.hxx"
#include "util/CharUtil.hxx"
#include "util/HexParse.hxx"
#include "util/StringSplit.hxx"
#include "util/UTF8.hxx"

#include <cstdint>
#include <utility>

#include <string.h>

using std::string_view_literals::operator""sv;

[[gnu::pure]]
static const char *
html_unescape_find(std::string_view p) noexcept
{
	const auto i = p.find('&');
	return i != p.npos
		? p.data() + i
		: nullptr;
}

/**
 * Parse a decimal or (with "x" prefix) hexadecimal character
 * reference.  Returns 0 on error.
 */
[[gnu::pure]]
static uint_least32_t
ParseCharacterReference(std::string_view s) noexcept
{
	uint_least32_t value = 0;

	if (s.starts_with('x') || s.starts_with('X')) {
		s.remove_prefix(1);
		if (s.empty() || s.size() > 6)
			return 0;

		for (const char ch : s) {
			const int d = ParseHexDigit(ch);
			if (d < 0)
				return 0;
			value = value * 0x10 + d;
		}
	} else {
		if (s.empty() || s.size() > 7)
			return 0;

		for (const char ch : s) {
			if (!IsDigitASCII(ch))
				return 0;
			value = value * 10 + (ch - '0');
		}
	}

	return value <= 0x10ffff ? value : 0;
}

/**
 * @return the replacement character or 0 if this is not a known
 * named entity
 */
[[gnu::pure]]
static char
ParseNamedEntity(std::string_view entity) noexcept
{
	if (entity == "amp"sv)
		return '&';
	else if (entity == "quot"sv)
		return '"';
	else if (entity == "lt"sv)
		return '<';
	else if (entity == "gt"sv)
		return '>';
	else if (entity == "apos"sv)
		return '\'';
	else
		return 0;
}

static size_t
html_unescape(std::string_view src, char *q) noexcept
{
	const char *const q_start = q;

	while (true) {
		const auto [before, after] = Split(src, '&');

		memmove(q, before.data(), before.size());
		q += before.size();

		if (after.data() == nullptr)
			break;

		const auto [entity, rest] = Split(after, ';');
		src = after;

		if (rest.data() == nullptr || entity.empty()) {
			/* not an entity; copy the ampersand literally */
			*q++ = '&';
			continue;
		}

		if (entity.front() == '#') {
			const auto ch = ParseCharacterReference(entity.substr(1));
			if (ch == 0) {
				*q++ = '&';
				continue;
			}

			q = UnicodeToUTF8(ch, q);
		} else if (const char ch = ParseNamedEntity(entity); ch != 0) {
			*q++ = ch;
		} else {
			*q++ = '&';
			continue;
		}

		src = rest;
	}

	return q - q_start;
}

[[gnu::const]]
static std::string_view
html_escape_char(char ch) noexcept
{
	switch (ch) {
	case '&':
		return "&amp;"sv;

	case '"':
		return "&quot;"sv;

	case '\'':
		return "&apos;"sv;

	case '<':
		return "&lt;"sv;

	case '>':
		return "&gt;"sv;

	default:
		return {};
	}
}

[[gnu::pure]]
static const char *
html_escape_find(std::string_view p) noexcept
{
	for (const char &ch : p)
		if (html_escape_char(ch).data() != nullptr)
			return &ch;

	return nullptr;
}

[[gnu::pure]]
static size_t
html_escape_size(std::string_view p) noexcept
{
	size_t size = 0;
	for (const char ch : p) {
		const auto e = html_escape_char(ch);
		size += e.data() != nullptr ? e.size() : 1;
	}

	return size;
}

static size_t
html_escape(std::string_view p, char *q) noexcept
{
	const char *const q_start = q;

	for (const char ch : p) {
		const auto e = html_escape_char(ch);
		if (e.data() != nullptr)
			q = (char *)mempcpy(q, e.data(), e.size());
		else
			*q++ = ch;
	}

	return q - q_start;
}

const struct escape_class html_escape_class = {
	html_unescape_find,
	html_unescape,
	html_escape_find,
	html_escape_size,
	html_escape,
};
