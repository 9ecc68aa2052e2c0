// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * A parsed absolute "http" or "https" URL.  The only way to obtain
 * one is Parse(), which guarantees that the scheme is known and the
 * host is not empty.
 */
struct AbsoluteUrl {
	/**
	 * Lower case, either "http" or "https".
	 */
	std::string scheme;

	std::string host;

	/**
	 * Empty if the URL does not specify a port.
	 */
	std::string port;

	/**
	 * Never empty; begins with a slash.
	 */
	std::string path;

	/**
	 * Without the leading question mark; empty if there is no
	 * query string.
	 */
	std::string query;

	/**
	 * Without the leading hash.
	 */
	std::string fragment;

	bool has_query = false, has_fragment = false;

	/**
	 * Parse and validate a URL.  Returns std::nullopt if the
	 * scheme is not "http"/"https" or if there is no (valid)
	 * host.
	 */
	[[gnu::pure]]
	static std::optional<AbsoluteUrl> Parse(std::string_view s) noexcept;

	/**
	 * @return "scheme://host[:port]"
	 */
	[[gnu::pure]]
	std::string GetOrigin() const noexcept;

	/**
	 * @return the value for a "Host" request header, i.e. the host
	 * name followed by the port if it is not the scheme's default
	 */
	[[gnu::pure]]
	std::string GetHostHeader() const noexcept;

	[[gnu::pure]]
	std::string ToString() const noexcept;
};
