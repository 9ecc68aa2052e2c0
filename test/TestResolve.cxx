// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "uri/Resolve.hxx"
#include "uri/AbsoluteUrl.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(ResolveUri, DocumentRelative)
{
	EXPECT_EQ(ResolveUri("../a"sv, "http://h/x/y/z"sv), "http://h/x/a"sv);
	EXPECT_EQ(ResolveUri("a"sv, "http://h/x/y"sv), "http://h/x/a"sv);
	EXPECT_EQ(ResolveUri("./a"sv, "http://h/x/"sv), "http://h/x/a"sv);
	EXPECT_EQ(ResolveUri("a/b/../c"sv, "http://h/"sv), "http://h/a/c"sv);
	EXPECT_EQ(ResolveUri("pic.png"sv, "http://site.test/dir/page.html"sv),
		  "http://site.test/dir/pic.png"sv);

	/* no path in the base at all */
	EXPECT_EQ(ResolveUri("a"sv, "http://h"sv), "http://h/a"sv);
}

TEST(ResolveUri, RootRelative)
{
	EXPECT_EQ(ResolveUri("/a"sv, "http://h/x/y"sv), "http://h/a"sv);
	EXPECT_EQ(ResolveUri("/a/./b/../c"sv, "http://h/x/y"sv), "http://h/a/c"sv);
	EXPECT_EQ(ResolveUri("/"sv, "https://h/x/y"sv), "https://h/"sv);
}

TEST(ResolveUri, SchemeRelative)
{
	EXPECT_EQ(ResolveUri("//h2/a"sv, "http://h/x"sv), "http://h2/a"sv);
	EXPECT_EQ(ResolveUri("//h2/a"sv, "https://h/x"sv), "https://h2/a"sv);
}

TEST(ResolveUri, Unresolvable)
{
	EXPECT_EQ(ResolveUri("http://other"sv, "http://h/x"sv), "http://other"sv);
	EXPECT_EQ(ResolveUri("HTTPS://other/a/../b"sv, "http://h/x"sv),
		  "HTTPS://other/a/../b"sv);
	EXPECT_EQ(ResolveUri("data:image/png;base64,AAAA"sv, "http://h/x"sv),
		  "data:image/png;base64,AAAA"sv);
	EXPECT_EQ(ResolveUri("mailto:a@b"sv, "http://h/x"sv), "mailto:a@b"sv);
	EXPECT_EQ(ResolveUri("JavaScript:void(0)"sv, "http://h/x"sv),
		  "JavaScript:void(0)"sv);
	EXPECT_EQ(ResolveUri("blob:abc"sv, "http://h/x"sv), "blob:abc"sv);
	EXPECT_EQ(ResolveUri("#top"sv, "http://h/x"sv), "#top"sv);
}

TEST(ResolveUri, InvalidBase)
{
	EXPECT_EQ(ResolveUri("a/b"sv, "not a url"sv), "a/b"sv);
	EXPECT_EQ(ResolveUri("/a"sv, "ftp://h/"sv), "/a"sv);
}

TEST(ResolveUri, Underflow)
{
	EXPECT_EQ(ResolveUri("../../../a"sv, "http://h/x"sv), "http://h/a"sv);
	EXPECT_EQ(ResolveUri("/../../a"sv, "http://h/x/y"sv), "http://h/a"sv);
}

TEST(ResolveUri, Whitespace)
{
	EXPECT_EQ(ResolveUri("  a.png\n"sv, "http://h/x/y"sv), "http://h/x/a.png"sv);
}

TEST(ResolveUri, QueryFragment)
{
	EXPECT_EQ(ResolveUri("a?b=1"sv, "http://h/x/y"sv), "http://h/x/a?b=1"sv);
	EXPECT_EQ(ResolveUri("/a#frag"sv, "http://h/x/y"sv), "http://h/a#frag"sv);
	EXPECT_EQ(ResolveUri("../a?q=../b#f"sv, "http://h/x/y/z"sv),
		  "http://h/x/a?q=../b#f"sv);

	/* a query string alone keeps the base path */
	EXPECT_EQ(ResolveUri("?page=2"sv, "http://h/x/y"sv), "http://h/x/y?page=2"sv);
}

TEST(ResolveUri, Empty)
{
	EXPECT_EQ(ResolveUri(""sv, "http://h/dir/page.html"sv),
		  "http://h/dir/page.html"sv);
	EXPECT_EQ(ResolveUri("  "sv, "http://h/dir/page.html?a=1#top"sv),
		  "http://h/dir/page.html?a=1"sv);
	EXPECT_EQ(ResolveUri(""sv, "http://h"sv), "http://h/"sv);
	EXPECT_EQ(ResolveUri("?b=2"sv, "http://h/dir/page.html?a=1"sv),
		  "http://h/dir/page.html?b=2"sv);
}

TEST(ResolveUri, TrailingSlash)
{
	EXPECT_EQ(ResolveUri("a/"sv, "http://h/x/y"sv), "http://h/x/a/"sv);
	EXPECT_EQ(ResolveUri("/v2/"sv, "http://h/x/y"sv), "http://h/v2/"sv);
	EXPECT_EQ(ResolveUri(".."sv, "http://h/x/y/z"sv), "http://h/x/"sv);
}

TEST(ResolveUri, Port)
{
	EXPECT_EQ(ResolveUri("a"sv, "http://h:8080/x/y"sv), "http://h:8080/x/a"sv);
	EXPECT_EQ(ResolveUri("//h2:81/a"sv, "http://h:8080/x"sv), "http://h2:81/a"sv);
}

TEST(ResolveUri, SameOrigin)
{
	static constexpr std::string_view references[] = {
		"a", "./b/c", "../../d", "/e", "f?g", "h/", "",
	};

	const auto base = AbsoluteUrl::Parse("https://example.com:8443/p/q/r.html"sv);
	ASSERT_TRUE(base);

	for (const auto r : references) {
		const auto resolved = AbsoluteUrl::Parse(ResolveUri(r, base->ToString()));
		ASSERT_TRUE(resolved) << r;
		EXPECT_EQ(resolved->scheme, base->scheme) << r;
		EXPECT_EQ(resolved->host, base->host) << r;
		EXPECT_EQ(resolved->port, base->port) << r;
	}
}

TEST(NormalizeUriPath, Basic)
{
	EXPECT_EQ(NormalizeUriPath(""sv), "/"sv);
	EXPECT_EQ(NormalizeUriPath("/"sv), "/"sv);
	EXPECT_EQ(NormalizeUriPath("//a//b"sv), "/a/b"sv);
	EXPECT_EQ(NormalizeUriPath("/a/./b/."sv), "/a/b/"sv);
	EXPECT_EQ(NormalizeUriPath("/a/../.."sv), "/"sv);
}

TEST(AbsoluteUrl, Parse)
{
	auto url = AbsoluteUrl::Parse("HTTP://user:pw@Example.com:81/a/b?c=d#e"sv);
	ASSERT_TRUE(url);
	EXPECT_EQ(url->scheme, "http");
	EXPECT_EQ(url->host, "Example.com");
	EXPECT_EQ(url->port, "81");
	EXPECT_EQ(url->path, "/a/b");
	EXPECT_EQ(url->query, "c=d");
	EXPECT_EQ(url->fragment, "e");
	EXPECT_EQ(url->GetOrigin(), "http://Example.com:81");
	EXPECT_EQ(url->GetHostHeader(), "Example.com:81");

	url = AbsoluteUrl::Parse("https://[::1]:443"sv);
	ASSERT_TRUE(url);
	EXPECT_EQ(url->host, "[::1]");
	EXPECT_EQ(url->path, "/");
	EXPECT_EQ(url->GetHostHeader(), "[::1]");
	EXPECT_EQ(url->ToString(), "https://[::1]:443/");

	url = AbsoluteUrl::Parse("http://h?"sv);
	ASSERT_TRUE(url);
	EXPECT_EQ(url->ToString(), "http://h/?");

	EXPECT_FALSE(AbsoluteUrl::Parse(""sv));
	EXPECT_FALSE(AbsoluteUrl::Parse("ftp://h/"sv));
	EXPECT_FALSE(AbsoluteUrl::Parse("http://"sv));
	EXPECT_FALSE(AbsoluteUrl::Parse("http:///path"sv));
	EXPECT_FALSE(AbsoluteUrl::Parse("http://h:99999/"sv));
	EXPECT_FALSE(AbsoluteUrl::Parse("http://h:x/"sv));
	EXPECT_FALSE(AbsoluteUrl::Parse("http://a b/"sv));
}
