// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CssRewrite.hxx"
#include "RewriteContext.hxx"
#include "parser/CssParser.hxx"

#include <vector>

namespace {

struct CssUrl {
	std::size_t start, end;
	std::string_view value;
};

class CssUrlCollector final : public CssParserHandler {
public:
	std::vector<CssUrl> urls;

	/* virtual methods from class CssParserHandler */
	void OnCssUrl(const CssParserValue &url) noexcept override {
		urls.push_back({url.start, url.end, url.value});
	}
};

} // anonymous namespace

static constexpr bool
IsCssUrlTrimChar(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\n' ||
		ch == '"' || ch == '\'';
}

/**
 * Remove surrounding whitespace and quotes from a url() argument.
 */
[[gnu::pure]]
static std::string_view
StripCssUrl(std::string_view value) noexcept
{
	while (!value.empty() && IsCssUrlTrimChar(value.front()))
		value.remove_prefix(1);

	while (!value.empty() && IsCssUrlTrimChar(value.back()))
		value.remove_suffix(1);

	return value;
}

std::optional<std::string>
CssRewriteUrls(std::string_view block, const RewriteContext &ctx) noexcept
{
	CssUrlCollector collector;
	CssParseUrls(block, collector);

	if (collector.urls.empty())
		/* no URLs found, no rewriting necessary */
		return std::nullopt;

	std::string dest;
	dest.reserve(block.size() + collector.urls.size() * 64);

	std::size_t position = 0;
	bool modified = false;

	for (const auto &url : collector.urls) {
		auto value = ctx.RewriteReference(StripCssUrl(url.value));
		if (!value)
			continue;

		dest.append(block.substr(position, url.start - position));
		dest.append("url(\"");
		dest.append(*value);
		dest.append("\")");
		position = url.end;
		modified = true;
	}

	if (!modified)
		return std::nullopt;

	dest.append(block.substr(position));
	return dest;
}
