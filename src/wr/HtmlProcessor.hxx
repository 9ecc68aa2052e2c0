// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Rewrite the references in a HTML document so they point to the
 * proxy.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

struct RewriteContext;

/**
 * Find the first <base> element in the document and return the
 * (unescaped) value of its "href" attribute.  Returns std::nullopt
 * if there is no <base> element or if the first one has no "href".
 */
[[gnu::pure]]
std::optional<std::string>
FindHtmlBaseHref(std::string_view document) noexcept;

/**
 * Rewrite the link attributes (href, src, srcset, ...), "style"
 * attributes and <style> elements of the given document.  Everything
 * else is copied verbatim, including malformed markup.
 *
 * If the document contains a <base> element, its "href" replaces
 * RewriteContext::base_url.
 *
 * If RewriteContext::deadline expires, the rest of the document is
 * copied without modification.
 */
std::string
ProcessHtml(std::string_view document, RewriteContext &ctx) noexcept;
