// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "wr/Config.hxx"
#include "io/config/LineParser.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <iterator>
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

/**
 * A temporary file which is deleted in the destructor.
 */
class TemporaryConfigFile {
	char path[64] = "/tmp/webrelay-test-XXXXXX";

public:
	explicit TemporaryConfigFile(std::string_view contents) {
		const int fd = mkstemp(path);
		if (fd < 0)
			throw std::runtime_error("mkstemp() failed");

		const auto nbytes = write(fd, contents.data(), contents.size());
		close(fd);

		if (nbytes != (ssize_t)contents.size())
			throw std::runtime_error("write() failed");
	}

	~TemporaryConfigFile() noexcept {
		unlink(path);
	}

	TemporaryConfigFile(const TemporaryConfigFile &) = delete;
	TemporaryConfigFile &operator=(const TemporaryConfigFile &) = delete;

	const char *GetPath() const noexcept {
		return path;
	}
};

TEST(LineParser, Words)
{
	char buffer[] = "  listen 127.0.0.1:8080  ";
	LineParser line(buffer);

	EXPECT_STREQ(line.ExpectWord(), "listen");
	EXPECT_STREQ(line.ExpectValueAndEnd(), "127.0.0.1:8080");
	EXPECT_TRUE(line.IsEnd());
}

TEST(LineParser, Values)
{
	char buffer[] = "set user_agent = \"Foo Bar/1.0\"";
	LineParser line(buffer);

	EXPECT_STREQ(line.ExpectWord(), "set");
	EXPECT_STREQ(line.ExpectWordAndSymbol('=', "name expected", "'=' expected"),
		     "user_agent");
	EXPECT_STREQ(line.ExpectValueAndEnd(), "Foo Bar/1.0");
}

TEST(LineParser, Errors)
{
	char buffer1[] = "workers 0";
	LineParser line1(buffer1);
	line1.ExpectWord();
	EXPECT_THROW(line1.NextPositiveInteger(), LineParser::Error);

	char buffer2[] = "set =1";
	LineParser line2(buffer2);
	line2.ExpectWord();
	EXPECT_THROW(line2.ExpectWordAndSymbol('=', "a", "b"), LineParser::Error);

	char buffer3[] = "a b c";
	LineParser line3(buffer3);
	line3.ExpectWord();
	EXPECT_THROW(line3.ExpectEnd(), LineParser::Error);

	char buffer4[] = "\"unterminated";
	LineParser line4(buffer4);
	EXPECT_EQ(line4.NextValue(), nullptr);
}

TEST(LineParser, Unescape)
{
	char buffer[] = "'a\\'b\\n' rest";
	LineParser line(buffer);

	EXPECT_STREQ(line.NextUnescape(), "a'b\n");
	EXPECT_STREQ(line.Rest(), "rest");
}

TEST(Config, Defaults)
{
	WrConfig config;
	config.Finish();

	ASSERT_FALSE(config.listen.empty());
	EXPECT_EQ(config.listen.front(), "*:8080");
	EXPECT_EQ(std::next(config.listen.begin()), config.listen.end());
	EXPECT_EQ(config.num_workers, 0u);
	EXPECT_EQ(config.fetch.connect_timeout, std::chrono::seconds(20));
	EXPECT_EQ(config.fetch.total_timeout, std::chrono::seconds(60));
	EXPECT_EQ(config.request_timeout, std::chrono::seconds(120));
	EXPECT_FALSE(config.fetch.verify_tls);
	EXPECT_TRUE(config.rewrite_special_schemes);
	EXPECT_FALSE(config.verbose_response);
	EXPECT_NE(config.fetch.user_agent.find("Chrome/91"), std::string::npos);
}

TEST(Config, HandleSet)
{
	WrConfig config;

	config.HandleSet("connect_timeout"sv, "5");
	EXPECT_EQ(config.fetch.connect_timeout, std::chrono::seconds(5));

	config.HandleSet("total_timeout"sv, "30");
	EXPECT_EQ(config.fetch.total_timeout, std::chrono::seconds(30));

	config.HandleSet("request_timeout"sv, "45");
	EXPECT_EQ(config.request_timeout, std::chrono::seconds(45));

	config.HandleSet("max_redirects"sv, "0");
	EXPECT_EQ(config.fetch.max_redirects, 0u);

	config.HandleSet("verify_tls"sv, "yes");
	EXPECT_TRUE(config.fetch.verify_tls);

	config.HandleSet("rewrite_special_schemes"sv, "no");
	EXPECT_FALSE(config.rewrite_special_schemes);

	config.HandleSet("verbose_response"sv, "yes");
	EXPECT_TRUE(config.verbose_response);

	config.HandleSet("user_agent"sv, "Test/1.0");
	EXPECT_EQ(config.fetch.user_agent, "Test/1.0");

	EXPECT_THROW(config.HandleSet("no_such_thing"sv, "1"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("connect_timeout"sv, "0"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("connect_timeout"sv, "abc"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("request_timeout"sv, "-1"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("max_redirects"sv, "1000"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("verify_tls"sv, "maybe"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("user_agent"sv, ""), std::runtime_error);
}

TEST(Config, File)
{
	const TemporaryConfigFile file("# comment\n"
				       "\n"
				       "listen 127.0.0.1:8080\n"
				       "  listen [::1]:8081  \n"
				       "workers 4\n"
				       "set request_timeout=30\n"
				       "set user_agent=\"Foo Bar\"\n"
				       "set verbose_response = yes\n"sv);

	WrConfig config;
	LoadConfigFile(config, file.GetPath());
	config.Finish();

	auto i = config.listen.begin();
	ASSERT_NE(i, config.listen.end());
	EXPECT_EQ(*i, "127.0.0.1:8080");
	++i;
	ASSERT_NE(i, config.listen.end());
	EXPECT_EQ(*i, "[::1]:8081");
	EXPECT_EQ(std::next(i), config.listen.end());

	EXPECT_EQ(config.num_workers, 4u);
	EXPECT_EQ(config.request_timeout, std::chrono::seconds(30));
	EXPECT_EQ(config.fetch.user_agent, "Foo Bar");
	EXPECT_TRUE(config.verbose_response);
}

TEST(Config, FileErrors)
{
	const TemporaryConfigFile file("listen *:80\n"
				       "frobnicate 1\n"sv);

	WrConfig config;

	try {
		LoadConfigFile(config, file.GetPath());
		FAIL() << "Exception expected";
	} catch (const std::runtime_error &e) {
		const auto msg = GetFullMessage(e);
		EXPECT_NE(msg.find("line 2"), std::string::npos) << msg;
		EXPECT_NE(msg.find("Unknown option"), std::string::npos) << msg;
	}

	const TemporaryConfigFile file2("set connect_timeout=never\n"sv);
	EXPECT_THROW(LoadConfigFile(config, file2.GetPath()), std::runtime_error);

	EXPECT_THROW(LoadConfigFile(config, "/nonexistent/webrelay.conf"),
		     std::runtime_error);
}
