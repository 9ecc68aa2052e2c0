// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

class ProxyLinkEncoder;

/**
 * Everything needed to rewrite the references in one document.
 */
struct RewriteContext {
	using Clock = std::chrono::steady_clock;

	const ProxyLinkEncoder &encoder;

	/**
	 * The absolute URL which relative references are resolved
	 * against.  Initially the effective URL of the upstream
	 * response; the HTML processor replaces it when the document
	 * contains a <base> element.
	 */
	std::string base_url;

	/**
	 * Rewriting is aborted (leaving the rest of the document
	 * unmodified) when this point in time has passed.
	 */
	Clock::time_point deadline = Clock::time_point::max();

	/**
	 * Pass references which cannot be resolved ("data:",
	 * "mailto:", fragments, absolute URLs of other schemes) through
	 * the proxy link encoder anyway?
	 */
	bool rewrite_special = true;

	RewriteContext(const ProxyLinkEncoder &_encoder,
		       std::string_view _base_url) noexcept
		:encoder(_encoder), base_url(_base_url) {}

	bool IsExpired() const noexcept {
		return deadline != Clock::time_point::max() &&
			Clock::now() >= deadline;
	}

	/**
	 * Resolve a reference against the base URL and convert it to
	 * a proxy link.
	 *
	 * @return the new reference or std::nullopt if the reference
	 * shall be left untouched
	 */
	std::optional<std::string> RewriteReference(std::string_view reference) const noexcept;
};
