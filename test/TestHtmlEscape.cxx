// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "escape/HTML.hxx"
#include "escape/String.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static std::string
Unescape(std::string_view p)
{
	return UnescapeToString(html_escape_class, p);
}

static std::string
Escape(std::string_view p)
{
	return EscapeToString(html_escape_class, p);
}

TEST(HtmlEscape, Unescape)
{
	EXPECT_EQ(Unescape(""sv), ""sv);
	EXPECT_EQ(Unescape("foo bar"sv), "foo bar"sv);
	EXPECT_EQ(Unescape("foo&amp;bar"sv), "foo&bar"sv);
	EXPECT_EQ(Unescape("&lt;&gt;"sv), "<>"sv);
	EXPECT_EQ(Unescape("&quot;&apos;"sv), "\"'"sv);
	EXPECT_EQ(Unescape("&amp;&amp;"sv), "&&"sv);
	EXPECT_EQ(Unescape("&amp;lt;"sv), "&lt;"sv);
	EXPECT_EQ(Unescape("&#65;&#x42;&#X43;"sv), "ABC"sv);
	EXPECT_EQ(Unescape("&#xe4;"sv), "\xc3\xa4"sv);
}

TEST(HtmlEscape, UnescapeMalformed)
{
	EXPECT_EQ(Unescape("&"sv), "&"sv);
	EXPECT_EQ(Unescape("a&b"sv), "a&b"sv);
	EXPECT_EQ(Unescape("&;"sv), "&;"sv);
	EXPECT_EQ(Unescape("&nbsp;"sv), "&nbsp;"sv);
	EXPECT_EQ(Unescape("&#;&#x;&#abc;"sv), "&#;&#x;&#abc;"sv);
	EXPECT_EQ(Unescape("a & b &amp; c"sv), "a & b & c"sv);
}

TEST(HtmlEscape, Escape)
{
	EXPECT_EQ(Escape(""sv), ""sv);
	EXPECT_EQ(Escape("foo bar"sv), "foo bar"sv);
	EXPECT_EQ(Escape("a&b"sv), "a&amp;b"sv);
	EXPECT_EQ(Escape("<\"'>"sv), "&lt;&quot;&apos;&gt;"sv);
	EXPECT_EQ(Escape("/proxy?url=http%3A%2F%2Fh%2F"sv),
		  "/proxy?url=http%3A%2F%2Fh%2F"sv);
}
