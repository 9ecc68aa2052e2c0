// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Find url() tokens in CSS source code.
 */

#pragma once

#include <cstddef>
#include <string_view>

struct CssParserValue {
	/**
	 * Offsets of the whole token, from the "u" of "url(" up to
	 * and including the closing parenthesis.
	 */
	std::size_t start, end;

	/**
	 * The raw argument between the parentheses (not trimmed,
	 * quotes included).
	 */
	std::string_view value;
};

class CssParserHandler {
public:
	virtual void OnCssUrl(const CssParserValue &url) noexcept = 0;
};

/**
 * Scan the given CSS source for url() tokens.  The match is purely
 * lexical (the "url" keyword is case-insensitive, the argument is
 * everything up to the next closing parenthesis and must not be
 * empty); comments and strings are not parsed.
 */
void
CssParseUrls(std::string_view src, CssParserHandler &handler) noexcept;
