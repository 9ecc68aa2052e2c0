// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProxyHandler.hxx"
#include "ProxyRequest.hxx"
#include "Config.hxx"
#include "ContentRewriter.hxx"
#include "Fetcher.hxx"
#include "ForwardHeaders.hxx"
#include "Form.hxx"
#include "RError.hxx"
#include "RewriteContext.hxx"
#include "HttpMessageResponse.hxx"
#include "http/Status.hxx"
#include "uri/AbsoluteUrl.hxx"
#include "uri/ProxyLink.hxx"
#include "util/StringCompare.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

/**
 * Add "http://" to a target which has no (known) scheme.
 */
[[gnu::pure]]
static std::string
CompleteTargetUrl(std::string_view target) noexcept
{
	if (StringStartsWithIgnoreCase(target, "http://"sv) ||
	    StringStartsWithIgnoreCase(target, "https://"sv))
		return std::string{target};

	return fmt::format("http://{}", target);
}

ProxyResponse
HandleProxyRequest(const ProxyRequest &request, UpstreamFetcher &fetcher,
		   const WrConfig &config)
{
	const auto target = DecodeProxyLinkTarget(request.query);
	if (!target || target->empty())
		return MakeInputForm(request.script_path);

	auto url = AbsoluteUrl::Parse(CompleteTargetUrl(*target));
	if (!url)
		throw HttpMessageResponse(HttpStatus::BAD_REQUEST,
					  fmt::format("Invalid target URL: {}",
						      *target));

	const auto deadline = RewriteContext::Clock::now() + config.request_timeout;

	const FetchRequest fetch_request{
		std::move(*url),
		request.accept, request.accept_language,
		deadline,
	};

	const auto result = fetcher.Fetch(fetch_request);

	const ProxyLinkEncoder encoder(request.script_path);

	ProxyResponse response;
	response.status = result.status;
	response.headers = ForwardResponseHeaders(result.raw_headers,
						  result.effective_url,
						  result.content_type,
						  encoder);

	RewriteContext ctx(encoder, result.effective_url);
	ctx.deadline = deadline;
	ctx.rewrite_special = config.rewrite_special_schemes;

	response.body = RewriteContent(result.body, result.content_type, ctx);
	return response;
}

ProxyResponse
HandleRequest(const ProxyRequest &request, UpstreamFetcher &fetcher,
	      const WrConfig &config) noexcept
{
	try {
		return HandleProxyRequest(request, fetcher, config);
	} catch (const std::exception &) {
		const auto uri = request.query.empty()
			? std::string{request.script_path}
			: fmt::format("{}?{}", request.script_path, request.query);
		return MakeErrorResponse(std::current_exception(), config, uri);
	}
}
