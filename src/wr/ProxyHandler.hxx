// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

struct ProxyRequest;
struct ProxyResponse;
struct WrConfig;
class UpstreamFetcher;

/**
 * Handle one proxy request: fetch the target named by the "url"
 * query parameter, rewrite the response headers and the body, and
 * return the result.  Without a target, the input form is returned.
 *
 * Throws #HttpMessageResponse if the target is not a valid URL and
 * #UpstreamError if it could not be fetched.
 */
ProxyResponse
HandleProxyRequest(const ProxyRequest &request, UpstreamFetcher &fetcher,
		   const WrConfig &config);

/**
 * Like HandleProxyRequest(), but errors are converted to error
 * responses.
 */
ProxyResponse
HandleRequest(const ProxyRequest &request, UpstreamFetcher &fetcher,
	      const WrConfig &config) noexcept;
