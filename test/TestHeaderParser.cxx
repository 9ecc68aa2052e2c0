// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/HeaderParser.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(HeaderParser, Line)
{
	HeaderList headers;

	EXPECT_TRUE(header_parse_line(headers, "Foo: bar"sv));
	EXPECT_TRUE(header_parse_line(headers, "X-Empty:"sv));
	EXPECT_TRUE(header_parse_line(headers, "Set-Cookie:  a=b; Path=/  "sv));
	EXPECT_TRUE(header_parse_line(headers, "Refresh: 0; url=http://h/"sv));
	EXPECT_TRUE(header_parse_line(headers, "X-Spaced \t: value"sv));

	EXPECT_FALSE(header_parse_line(headers, "no colon"sv));
	EXPECT_FALSE(header_parse_line(headers, ": no name"sv));
	EXPECT_FALSE(header_parse_line(headers, "Bad Name: x"sv));

	ASSERT_EQ(headers.size(), 5u);
	EXPECT_EQ(headers[0].first, "Foo");
	EXPECT_EQ(headers[0].second, "bar");
	EXPECT_EQ(headers[1].first, "X-Empty");
	EXPECT_EQ(headers[1].second, "");
	EXPECT_EQ(headers[2].second, "a=b; Path=/");
	EXPECT_EQ(headers[3].second, "0; url=http://h/");
	EXPECT_EQ(headers[4].first, "X-Spaced");
	EXPECT_EQ(headers[4].second, "value");
}

TEST(HeaderParser, Buffer)
{
	const auto headers = header_parse_buffer("HTTP/1.1 200 OK\r\n"
						 "Content-Type: text/html\r\n"
						 "Set-Cookie: a=1\n"
						 "Set-Cookie: b=2\r"
						 "garbage\r\n"
						 "\r\n"sv);

	ASSERT_EQ(headers.size(), 3u);
	EXPECT_EQ(headers[0].first, "Content-Type");
	EXPECT_EQ(headers[0].second, "text/html");
	EXPECT_EQ(headers[1].first, "Set-Cookie");
	EXPECT_EQ(headers[1].second, "a=1");
	EXPECT_EQ(headers[2].first, "Set-Cookie");
	EXPECT_EQ(headers[2].second, "b=2");
}

TEST(HeaderParser, StatusLines)
{
	/* every status line is skipped, wherever it appears */
	const auto headers = header_parse_buffer("HTTP/1.1 100 Continue\r\n\r\n"
						 "http/2 200\r\n"
						 "A: b\r\n"sv);

	ASSERT_EQ(headers.size(), 1u);
	EXPECT_EQ(headers[0].first, "A");
}

TEST(HeaderParser, Empty)
{
	EXPECT_TRUE(header_parse_buffer(""sv).empty());
	EXPECT_TRUE(header_parse_buffer("\r\n\r\n"sv).empty());
}
