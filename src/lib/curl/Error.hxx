// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <curl/curl.h>

#include <stdexcept>

/**
 * An error reported by libcurl.
 */
class CurlError : public std::runtime_error {
	CURLcode code;

public:
	CurlError(CURLcode _code, const char *_msg) noexcept
		:std::runtime_error(_msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};

namespace Curl {

/**
 * Construct a #CurlError with a message which includes
 * curl_easy_strerror().
 */
CurlError
MakeError(CURLcode code, const char *prefix) noexcept;

} // namespace Curl
