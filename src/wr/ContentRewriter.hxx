// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

struct RewriteContext;

enum class ContentKind {
	HTML,
	CSS,

	/**
	 * Everything else: passed through without modification.
	 */
	OTHER,
};

/**
 * Classify a "Content-Type" value by its primary type (parameters
 * are ignored, the comparison is case-insensitive).
 */
[[gnu::pure]]
ContentKind
ClassifyContentType(std::string_view content_type) noexcept;

/**
 * Rewrite all references in a response body according to its
 * content type.  This never fails; unparsable input is passed
 * through as well as possible.
 */
std::string
RewriteContent(std::string_view body, std::string_view content_type,
	       RewriteContext &ctx) noexcept;
