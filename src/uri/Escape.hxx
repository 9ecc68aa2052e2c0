// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escape and unescape in URI style ('%20').
 */

#pragma once

#include <string>
#include <string_view>

/**
 * Escape all characters except the unreserved ones (RFC 3986 2.3:
 * ALPHA, DIGIT, '-', '.', '_', '~').  This is suitable for a query
 * string component; a space becomes "%20", not "+".
 */
[[gnu::pure]]
std::string
UriEscape(std::string_view src) noexcept;

/**
 * Reverse UriEscape().  Malformed escape sequences are copied
 * verbatim.
 *
 * @param plus_is_space decode '+' to a space, as HTML forms encode
 * query strings ("application/x-www-form-urlencoded")
 */
[[gnu::pure]]
std::string
UriUnescape(std::string_view src, bool plus_is_space=false) noexcept;
