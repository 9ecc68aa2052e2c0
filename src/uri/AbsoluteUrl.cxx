// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AbsoluteUrl.hxx"
#include "util/CharUtil.hxx"
#include "util/StringCompare.hxx"

using std::string_view_literals::operator""sv;

static constexpr bool
IsHostChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '-' || ch == '.' ||
		ch == '_' || ch == '~' || ch == '%' ||
		/* IPv6 literals */
		ch == ':' || ch == '[' || ch == ']' ||
		/* UTF-8 (IDN) host names are passed through to libcurl */
		!IsASCII(ch);
}

[[gnu::pure]]
static bool
IsValidHost(std::string_view host) noexcept
{
	if (host.empty())
		return false;

	for (char ch : host)
		if (!IsHostChar(ch))
			return false;

	if (host.front() == '[')
		return host.size() > 2 && host.back() == ']';

	return host.find(':') == host.npos;
}

[[gnu::pure]]
static bool
IsValidPort(std::string_view port) noexcept
{
	if (port.empty() || port.size() > 5)
		return false;

	unsigned value = 0;
	for (char ch : port) {
		if (!IsDigitASCII(ch))
			return false;
		value = value * 10 + unsigned(ch - '0');
	}

	return value > 0 && value <= 65535;
}

std::optional<AbsoluteUrl>
AbsoluteUrl::Parse(std::string_view s) noexcept
{
	AbsoluteUrl url;

	if (StringStartsWithIgnoreCase(s, "http://"sv)) {
		url.scheme = "http";
		s.remove_prefix(7);
	} else if (StringStartsWithIgnoreCase(s, "https://"sv)) {
		url.scheme = "https";
		s.remove_prefix(8);
	} else
		return std::nullopt;

	/* the authority ends at the first slash, question mark or
	   hash */
	const auto authority_end = s.find_first_of("/?#"sv);
	std::string_view authority = s.substr(0, authority_end);
	std::string_view rest = authority_end == s.npos
		? std::string_view{}
		: s.substr(authority_end);

	/* strip user info */
	if (const auto at = authority.rfind('@'); at != authority.npos)
		authority = authority.substr(at + 1);

	std::string_view host = authority, port{};
	if (const auto colon = authority.rfind(':');
	    colon != authority.npos &&
	    authority.find(']', colon) == authority.npos) {
		host = authority.substr(0, colon);
		port = authority.substr(colon + 1);

		if (!port.empty() && !IsValidPort(port))
			return std::nullopt;
	}

	if (!IsValidHost(host))
		return std::nullopt;

	url.host = host;
	url.port = port;

	if (const auto hash = rest.find('#'); hash != rest.npos) {
		url.fragment = rest.substr(hash + 1);
		url.has_fragment = true;
		rest = rest.substr(0, hash);
	}

	if (const auto q = rest.find('?'); q != rest.npos) {
		url.query = rest.substr(q + 1);
		url.has_query = true;
		rest = rest.substr(0, q);
	}

	url.path = rest.empty() ? "/"sv : rest;
	return url;
}

std::string
AbsoluteUrl::GetOrigin() const noexcept
{
	std::string result = scheme;
	result += "://"sv;
	result += host;
	if (!port.empty()) {
		result.push_back(':');
		result += port;
	}

	return result;
}

std::string
AbsoluteUrl::GetHostHeader() const noexcept
{
	if (port.empty() ||
	    (scheme == "http"sv && port == "80"sv) ||
	    (scheme == "https"sv && port == "443"sv))
		return host;

	std::string result = host;
	result.push_back(':');
	result += port;
	return result;
}

std::string
AbsoluteUrl::ToString() const noexcept
{
	std::string result = GetOrigin();
	result += path;

	if (has_query) {
		result.push_back('?');
		result += query;
	}

	if (has_fragment) {
		result.push_back('#');
		result += fragment;
	}

	return result;
}
