// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * A HTTP response status code.  Upstream statuses are forwarded
 * verbatim, so any value between 100 and 599 may occur; only a few
 * have a name.
 */
enum class HttpStatus : uint_least16_t {
	OK = 200,

	FOUND = 302,

	BAD_REQUEST = 400,
	NOT_FOUND = 404,

	INTERNAL_SERVER_ERROR = 500,
	BAD_GATEWAY = 502,
};

constexpr bool
http_status_is_valid(HttpStatus status) noexcept
{
	return unsigned(status) >= 100 && unsigned(status) <= 599;
}
