// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RError.hxx"
#include "ProxyRequest.hxx"
#include "Config.hxx"
#include "Fetcher.hxx"
#include "HttpMessageResponse.hxx"
#include "http/Status.hxx"
#include "escape/HTML.hxx"
#include "escape/String.hxx"
#include "io/Logger.hxx"
#include "util/Exception.hxx"

static ProxyResponse
MakeTextResponse(HttpStatus status, std::string_view msg) noexcept
{
	ProxyResponse response;
	response.status = status;
	response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
	response.body.reserve(msg.size() + 1);
	response.body.append(msg);
	response.body.push_back('\n');
	return response;
}

static ProxyResponse
MakeUpstreamErrorResponse(std::string_view msg) noexcept
{
	ProxyResponse response;
	response.status = HttpStatus::BAD_GATEWAY;
	response.headers.emplace_back("Content-Type", "text/html; charset=utf-8");
	response.body = "<h3>Proxy Error</h3>"
		"<p>Could not retrieve the requested page.</p>"
		"<p>Error: ";
	response.body.append(EscapeToString(html_escape_class, msg));
	response.body.append("</p>");
	return response;
}

ProxyResponse
MakeErrorResponse(std::exception_ptr ep, const WrConfig &config,
		  std::string_view uri) noexcept
{
	if (const auto *r = FindNested<HttpMessageResponse>(ep))
		/* don't log this, just send the response directly */
		return MakeTextResponse(r->GetStatus(), r->what());

	if (FindNested<UpstreamError>(ep)) {
		LogConcat(2, "proxy", "error on '", uri, "': ", ep);
		return MakeUpstreamErrorResponse(GetFullMessage(ep));
	}

	LogConcat(1, "proxy", "error on '", uri, "': ", ep);

	if (config.verbose_response)
		return MakeTextResponse(HttpStatus::INTERNAL_SERVER_ERROR,
					GetFullMessage(ep));

	return MakeTextResponse(HttpStatus::INTERNAL_SERVER_ERROR,
				"Internal server error");
}
