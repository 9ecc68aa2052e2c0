// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "wr/CssRewrite.hxx"
#include "wr/RewriteContext.hxx"
#include "parser/CssParser.hxx"
#include "uri/ProxyLink.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using std::string_view_literals::operator""sv;

namespace {

struct CssUrlRecorder final : CssParserHandler {
	std::vector<std::string> urls;

	void OnCssUrl(const CssParserValue &url) noexcept override {
		urls.emplace_back(url.value);
	}
};

} // anonymous namespace

TEST(CssParser, Urls)
{
	CssUrlRecorder recorder;
	CssParseUrls("a{b:url(x.png)} c{d:URL( 'y.png' )} e{f:url()} g{h:url(\"z\""sv,
		     recorder);

	ASSERT_EQ(recorder.urls.size(), 2u);
	EXPECT_EQ(recorder.urls[0], "x.png");
	EXPECT_EQ(recorder.urls[1], " 'y.png' ");
}

TEST(CssRewrite, Unquoted)
{
	const ProxyLinkEncoder encoder("/proxy"sv);
	const RewriteContext ctx(encoder, "http://site.test/dir/page.html"sv);

	const auto result = CssRewriteUrls("body{background:url(/img/a.png)}"sv, ctx);
	ASSERT_TRUE(result);
	EXPECT_EQ(*result,
		  "body{background:url(\"/proxy?url=http%3A%2F%2Fsite.test%2Fimg%2Fa.png\")}"sv);
}

TEST(CssRewrite, Quoted)
{
	const ProxyLinkEncoder encoder("/proxy"sv);
	const RewriteContext ctx(encoder, "http://h/css/main.css"sv);

	auto result = CssRewriteUrls("a{b:url( \"../f.woff\" )}"sv, ctx);
	ASSERT_TRUE(result);
	EXPECT_EQ(*result, "a{b:url(\"/proxy?url=http%3A%2F%2Fh%2Ff.woff\")}"sv);

	result = CssRewriteUrls("a{b:url('x.png')}"sv, ctx);
	ASSERT_TRUE(result);
	EXPECT_EQ(*result, "a{b:url(\"/proxy?url=http%3A%2F%2Fh%2Fcss%2Fx.png\")}"sv);
}

TEST(CssRewrite, Multiple)
{
	const ProxyLinkEncoder encoder("/p"sv);
	const RewriteContext ctx(encoder, "http://h/"sv);

	const auto result =
		CssRewriteUrls("@import url(a.css);\n"
			       ".x { background: URL(b.png) no-repeat }\n"
			       ".y { src: Url(http://cdn/c.woff) }\n"sv,
			       ctx);
	ASSERT_TRUE(result);
	EXPECT_EQ(*result,
		  "@import url(\"/p?url=http%3A%2F%2Fh%2Fa.css\");\n"
		  ".x { background: url(\"/p?url=http%3A%2F%2Fh%2Fb.png\") no-repeat }\n"
		  ".y { src: url(\"/p?url=http%3A%2F%2Fcdn%2Fc.woff\") }\n"sv);
}

TEST(CssRewrite, NoUrls)
{
	const ProxyLinkEncoder encoder("/proxy"sv);
	const RewriteContext ctx(encoder, "http://h/"sv);

	EXPECT_FALSE(CssRewriteUrls(""sv, ctx));
	EXPECT_FALSE(CssRewriteUrls("body { color: red }"sv, ctx));
	EXPECT_FALSE(CssRewriteUrls("a{b:url()}"sv, ctx));
	EXPECT_FALSE(CssRewriteUrls("a{b:url(x.png"sv, ctx));
}

TEST(CssRewrite, SpecialSchemes)
{
	const ProxyLinkEncoder encoder("/proxy"sv);
	RewriteContext ctx(encoder, "http://h/"sv);

	auto result = CssRewriteUrls("a{b:url(data:image/png;base64,AA)}"sv, ctx);
	ASSERT_TRUE(result);
	EXPECT_EQ(*result,
		  "a{b:url(\"/proxy?url=data%3Aimage%2Fpng%3Bbase64%2CAA\")}"sv);

	ctx.rewrite_special = false;
	EXPECT_FALSE(CssRewriteUrls("a{b:url(data:image/png;base64,AA)}"sv, ctx));

	/* absolute URLs are still routed through the proxy */
	result = CssRewriteUrls("a{b:url(data:x)} c{d:url(https://o/x)}"sv, ctx);
	ASSERT_TRUE(result);
	EXPECT_EQ(*result,
		  "a{b:url(data:x)} c{d:url(\"/proxy?url=https%3A%2F%2Fo%2Fx\")}"sv);
}
