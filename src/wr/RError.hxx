// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <string_view>

struct ProxyResponse;
struct WrConfig;

/**
 * Convert an exception thrown while handling a request to an error
 * response, and log it.
 *
 * - #HttpMessageResponse: its status with the message as plain text
 *   (not logged)
 * - #UpstreamError: "502 Bad Gateway" with a HTML page describing
 *   the transport error
 * - anything else: "500 Internal Server Error"
 *
 * @param uri the request URI (for logging)
 */
ProxyResponse
MakeErrorResponse(std::exception_ptr ep, const WrConfig &config,
		  std::string_view uri) noexcept;
