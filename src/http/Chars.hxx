// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Character classes of RFC 9110 5.6.2 (tokens).
 */

#pragma once

#include "util/CharUtil.hxx"

/**
 * Is this one of the "tchar" characters allowed in a token (e.g. a
 * header name)?
 */
constexpr bool
IsHttpTokenChar(char ch) noexcept
{
	switch (ch) {
	case '!': case '#': case '$': case '%': case '&': case '\'':
	case '*': case '+': case '-': case '.': case '^': case '_':
	case '`': case '|': case '~':
		return true;

	default:
		return IsAlphaNumericASCII(ch);
	}
}
