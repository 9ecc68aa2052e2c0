// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ContentRewriter.hxx"
#include "CssRewrite.hxx"
#include "HtmlProcessor.hxx"
#include "RewriteContext.hxx"
#include "io/Logger.hxx"
#include "util/StringCompare.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"

using std::string_view_literals::operator""sv;

ContentKind
ClassifyContentType(std::string_view content_type) noexcept
{
	const auto type = Strip(Split(content_type, ';').first);

	if (StringIsEqualIgnoreCase(type, "text/html"sv))
		return ContentKind::HTML;

	if (StringIsEqualIgnoreCase(type, "text/css"sv))
		return ContentKind::CSS;

	return ContentKind::OTHER;
}

std::string
RewriteContent(std::string_view body, std::string_view content_type,
	       RewriteContext &ctx) noexcept
{
	switch (ClassifyContentType(content_type)) {
	case ContentKind::HTML:
		LogConcat(5, "rewrite", "HTML document, base ", ctx.base_url);
		return ProcessHtml(body, ctx);

	case ContentKind::CSS:
		LogConcat(5, "rewrite", "style sheet, base ", ctx.base_url);
		if (auto css = CssRewriteUrls(body, ctx))
			return std::move(*css);
		break;

	case ContentKind::OTHER:
		break;
	}

	return std::string{body};
}
