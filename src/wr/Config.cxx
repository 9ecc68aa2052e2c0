// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "util/StringParser.hxx"

#include <fmt/core.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

static std::chrono::seconds
ParseSeconds(const char *s)
{
	return std::chrono::seconds(ParsePositiveLong(s, 24 * 3600));
}

void
WrConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "connect_timeout"sv) {
		fetch.connect_timeout = ParseSeconds(value);
	} else if (name == "total_timeout"sv) {
		fetch.total_timeout = ParseSeconds(value);
	} else if (name == "request_timeout"sv) {
		request_timeout = ParseSeconds(value);
	} else if (name == "max_redirects"sv) {
		fetch.max_redirects = ParseUnsignedLong(value);
		if (fetch.max_redirects > 100)
			throw std::runtime_error("Value is too large");
	} else if (name == "verify_tls"sv) {
		fetch.verify_tls = ParseBool(value);
	} else if (name == "user_agent"sv) {
		if (*value == 0)
			throw std::runtime_error("Invalid value");

		fetch.user_agent = value;
	} else if (name == "rewrite_special_schemes"sv) {
		rewrite_special_schemes = ParseBool(value);
	} else if (name == "verbose_response"sv) {
		verbose_response = ParseBool(value);
	} else
		throw std::runtime_error("Unknown variable");
}

void
WrConfig::Finish()
{
	if (listen.empty())
		listen.emplace_front(fmt::format("*:{}", default_port));
	else
		/* reverse the list because our ConfigParser always
		   inserts at the front */
		listen.reverse();
}
