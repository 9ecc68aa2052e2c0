// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Generate and parse links which route a target URL through this
 * proxy.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * The name of the query parameter carrying the target URL.
 */
inline constexpr std::string_view proxy_link_parameter = "url";

/**
 * Builds client-facing links of the form
 * "<script_path>?url=<escaped target>".  This is the only place where
 * such links are constructed.
 */
class ProxyLinkEncoder {
	const std::string script_path;

public:
	/**
	 * @param _script_path the path of the inbound request, i.e. the
	 * path under which this proxy was invoked
	 */
	explicit ProxyLinkEncoder(std::string_view _script_path) noexcept
		:script_path(_script_path) {}

	const std::string &GetScriptPath() const noexcept {
		return script_path;
	}

	[[gnu::pure]]
	std::string Encode(std::string_view target) const noexcept;
};

/**
 * Look up a parameter in a query string (without the leading
 * question mark) and return its unescaped value.  Returns
 * std::nullopt if the parameter is not present.
 */
[[gnu::pure]]
std::optional<std::string>
FindQueryParameter(std::string_view query, std::string_view name) noexcept;

/**
 * Extract the target URL from the query string of a link generated
 * by ProxyLinkEncoder::Encode().
 */
[[gnu::pure]]
inline std::optional<std::string>
DecodeProxyLinkTarget(std::string_view query) noexcept
{
	return FindQueryParameter(query, proxy_link_parameter);
}
