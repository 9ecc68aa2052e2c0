// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/HeaderList.hxx"

#include <cstdint>
#include <string>
#include <string_view>

enum class HttpStatus : uint_least16_t;

/**
 * The parts of an inbound HTTP request which are relevant for the
 * proxy.
 */
struct ProxyRequest {
	/**
	 * The path of the request URI (without the query string).
	 * All proxy links generated for this request point to it.
	 */
	std::string_view script_path;

	/**
	 * The query string without the question mark; may be empty.
	 */
	std::string_view query;

	/**
	 * Values of the "Accept" and "Accept-Language" request headers
	 * (empty if not present).
	 */
	std::string_view accept, accept_language;
};

/**
 * A complete response to be sent to the HTTP client.
 */
struct ProxyResponse {
	HttpStatus status;

	HeaderList headers;

	std::string body;
};
