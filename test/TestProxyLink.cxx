// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "uri/ProxyLink.hxx"
#include "uri/Escape.hxx"
#include "util/StringSplit.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(UriEscape, Basic)
{
	EXPECT_EQ(UriEscape(""sv), ""sv);
	EXPECT_EQ(UriEscape("abcXYZ019-._~"sv), "abcXYZ019-._~"sv);
	EXPECT_EQ(UriEscape("http://h/a b?c=d&e"sv),
		  "http%3A%2F%2Fh%2Fa%20b%3Fc%3Dd%26e"sv);
	EXPECT_EQ(UriEscape("\xc3\xa4"sv), "%C3%A4"sv);
}

TEST(UriEscape, Unescape)
{
	EXPECT_EQ(UriUnescape("a%20b"sv), "a b"sv);
	EXPECT_EQ(UriUnescape("a%2fb%2F"sv), "a/b/"sv);
	EXPECT_EQ(UriUnescape("a+b"sv), "a+b"sv);
	EXPECT_EQ(UriUnescape("a+b"sv, true), "a b"sv);

	/* malformed escapes are copied literally */
	EXPECT_EQ(UriUnescape("%"sv), "%"sv);
	EXPECT_EQ(UriUnescape("%4"sv), "%4"sv);
	EXPECT_EQ(UriUnescape("%zz"sv), "%zz"sv);
}

TEST(ProxyLink, Encode)
{
	const ProxyLinkEncoder encoder("/proxy"sv);
	EXPECT_EQ(encoder.GetScriptPath(), "/proxy"sv);
	EXPECT_EQ(encoder.Encode("http://site.test/dir/pic.png"sv),
		  "/proxy?url=http%3A%2F%2Fsite.test%2Fdir%2Fpic.png"sv);
	EXPECT_EQ(encoder.Encode(""sv), "/proxy?url="sv);
}

TEST(ProxyLink, FindQueryParameter)
{
	EXPECT_FALSE(FindQueryParameter(""sv, "url"sv));
	EXPECT_FALSE(FindQueryParameter("foo=bar"sv, "url"sv));
	EXPECT_FALSE(FindQueryParameter("urlx=1"sv, "url"sv));
	EXPECT_EQ(FindQueryParameter("url"sv, "url"sv), ""sv);
	EXPECT_EQ(FindQueryParameter("url="sv, "url"sv), ""sv);
	EXPECT_EQ(FindQueryParameter("a=1&url=x%20y&url=z"sv, "url"sv), "x y"sv);
	EXPECT_EQ(FindQueryParameter("url=a+b"sv, "url"sv), "a b"sv);
	EXPECT_EQ(FindQueryParameter("u%72l=1"sv, "url"sv), "1"sv);
}

TEST(ProxyLink, RoundTrip)
{
	static constexpr std::string_view urls[] = {
		"http://site.test/",
		"https://example.com:8443/a/b/c.html?x=1&y=2#frag",
		"http://h/path with spaces/+plus+/%25",
		"http://h/?url=nested&a=%2F",
		"http://xn--bcher-kva.example/\xc3\xa4\xc3\xb6",
	};

	const ProxyLinkEncoder encoder("/some/script"sv);

	for (const auto url : urls) {
		const auto link = encoder.Encode(url);
		const auto [path, query] = Split(std::string_view{link}, '?');
		EXPECT_EQ(path, "/some/script"sv);

		const auto decoded = DecodeProxyLinkTarget(query);
		ASSERT_TRUE(decoded) << url;
		EXPECT_EQ(*decoded, url);
	}
}
