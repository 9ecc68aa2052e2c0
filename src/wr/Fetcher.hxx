// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "uri/AbsoluteUrl.hxx"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

enum class HttpStatus : uint_least16_t;
struct WrFetchConfig;

/**
 * Fetching the upstream resource has failed on the transport level
 * (DNS, connect, TLS, timeout, ...).  The message describes the
 * cause; nested exceptions may carry details.
 */
class UpstreamError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

struct FetchRequest {
	AbsoluteUrl url;

	/**
	 * Values of the client's "Accept" and "Accept-Language"
	 * request headers (empty if the client did not send them).
	 */
	std::string_view accept, accept_language;

	/**
	 * The transfer must be finished by then.
	 */
	std::chrono::steady_clock::time_point deadline =
		std::chrono::steady_clock::time_point::max();
};

struct FetchResult {
	HttpStatus status;

	/**
	 * The header block of the final (post-redirect) response,
	 * status line included, exactly as received.
	 */
	std::string raw_headers;

	/**
	 * The (decoded) response body.
	 */
	std::string body;

	/**
	 * The URL the response was finally received from.
	 */
	std::string effective_url;

	/**
	 * The declared content type of the final response; empty if
	 * there was none.
	 */
	std::string content_type;
};

/**
 * Fetches a resource from an upstream HTTP server.
 */
class UpstreamFetcher {
public:
	virtual ~UpstreamFetcher() noexcept = default;

	/**
	 * Throws #UpstreamError on transport failure.  A HTTP error
	 * status is not a failure.
	 */
	virtual FetchResult Fetch(const FetchRequest &request) = 0;
};

/**
 * An #UpstreamFetcher implementation using libcurl.  Redirects are
 * followed; the body is decoded transparently.
 */
class CurlFetcher final : public UpstreamFetcher {
	const WrFetchConfig &config;

public:
	explicit CurlFetcher(const WrFetchConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class UpstreamFetcher */
	FetchResult Fetch(const FetchRequest &request) override;
};
