// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fetcher.hxx"
#include "Config.hxx"
#include "http/Status.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Slist.hxx"
#include "io/Logger.hxx"
#include "util/StringCompare.hxx"

#include <fmt/core.h>

#include <algorithm>

using std::string_view_literals::operator""sv;

namespace {

/**
 * Collects the response of one transfer.
 */
struct CurlFetchResponse {
	std::string headers, body;

	static std::size_t HeaderFunction(char *ptr, std::size_t size,
					  std::size_t nmemb,
					  void *userdata) noexcept {
		auto &r = *(CurlFetchResponse *)userdata;
		const std::string_view line{ptr, size * nmemb};

		if (StringStartsWithIgnoreCase(line, "HTTP/"sv))
			/* a new response begins (after a redirect or a
			   "100 Continue"); only the last one counts */
			r.headers.clear();

		r.headers.append(line);
		return line.size();
	}

	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *userdata) noexcept {
		auto &r = *(CurlFetchResponse *)userdata;
		r.body.append(ptr, size * nmemb);
		return size * nmemb;
	}
};

} // anonymous namespace

/**
 * Clamp a timeout to the time remaining until the deadline.
 */
static std::chrono::milliseconds
ClampTimeout(std::chrono::milliseconds timeout,
	     std::chrono::steady_clock::time_point deadline)
{
	if (deadline == std::chrono::steady_clock::time_point::max())
		return timeout;

	const auto remaining =
		std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
	if (remaining.count() <= 0)
		throw UpstreamError("Request deadline expired");

	return std::min(timeout, remaining);
}

FetchResult
CurlFetcher::Fetch(const FetchRequest &request)
{
	const auto url = request.url.ToString();

	const auto timeout = ClampTimeout(config.total_timeout,
					  request.deadline);
	const auto connect_timeout = std::min<std::chrono::milliseconds>(config.connect_timeout,
									 timeout);

	CurlSlist header_list;
	header_list.Append(fmt::format("Host: {}",
				       request.url.GetHostHeader()).c_str());

	if (!request.accept.empty())
		header_list.Append(fmt::format("Accept: {}",
					       request.accept).c_str());

	if (!request.accept_language.empty())
		header_list.Append(fmt::format("Accept-Language: {}",
					       request.accept_language).c_str());

	CurlFetchResponse response;
	char error_buffer[CURL_ERROR_SIZE] = "";

	CurlEasy easy{url.c_str()};
	easy.SetErrorBuffer(error_buffer);
	easy.SetNoProgress();
	easy.SetNoSignal();
	easy.SetFollowLocation(true, long(config.max_redirects));
	easy.SetConnectTimeout(connect_timeout);
	easy.SetTimeout(timeout);
	easy.SetVerifyPeer(config.verify_tls);
	easy.SetVerifyHost(config.verify_tls);
	easy.SetAcceptAllEncodings();
	easy.SetUserAgent(config.user_agent.c_str());
	easy.SetRequestHeaders(header_list.Get());
	easy.SetHeaderFunction(CurlFetchResponse::HeaderFunction, &response);
	easy.SetWriteFunction(CurlFetchResponse::WriteFunction, &response);

	LogConcat(5, "fetch", "GET ", url);

	CURLcode code = curl_easy_perform(easy.Get());
	if (code != CURLE_OK)
		throw UpstreamError(*error_buffer != 0
				    ? error_buffer
				    : curl_easy_strerror(code));

	const auto status = HttpStatus(easy.GetResponseCode());
	if (!http_status_is_valid(status))
		throw UpstreamError(fmt::format("Malformed response status from {}",
						url));

	FetchResult result;
	result.status = status;
	result.raw_headers = std::move(response.headers);
	result.body = std::move(response.body);

	if (const char *effective_url = easy.GetEffectiveURL())
		result.effective_url = effective_url;
	else
		result.effective_url = url;

	if (const char *content_type = easy.GetContentType())
		result.content_type = content_type;

	LogConcat(5, "fetch", unsigned(result.status), " ",
		  result.effective_url, " ", result.content_type);

	return result;
}
