// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ProxyLink.hxx"
#include "Escape.hxx"
#include "util/StringSplit.hxx"

std::string
ProxyLinkEncoder::Encode(std::string_view target) const noexcept
{
	std::string result = script_path;
	result.push_back('?');
	result += proxy_link_parameter;
	result.push_back('=');
	result += UriEscape(target);
	return result;
}

std::optional<std::string>
FindQueryParameter(std::string_view query, std::string_view name) noexcept
{
	while (query.data() != nullptr) {
		const auto [pair, rest] = Split(query, '&');
		query = rest;

		const auto [key, value] = Split(pair, '=');
		if (UriUnescape(key, true) != name)
			continue;

		if (value.data() == nullptr)
			return std::string{};

		return UriUnescape(value, true);
	}

	return std::nullopt;
}
