// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Classify characters in a HTML/XML document.
 */

#pragma once

#include "util/CharUtil.hxx"

constexpr bool
IsHtmlNameStartChar(char ch) noexcept
{
	return IsAlphaASCII(ch) ||
		ch == ':' || ch == '_';
}

constexpr bool
IsHtmlNameChar(char ch) noexcept
{
	return IsHtmlNameStartChar(ch) || IsDigitASCII(ch) ||
		ch == '-' || ch == '.';
}
