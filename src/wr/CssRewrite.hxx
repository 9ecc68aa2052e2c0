// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>
#include <string_view>

struct RewriteContext;

/**
 * Rewrite all url() tokens in a CSS block (a style sheet, the
 * contents of a <style> element or a "style" attribute value).
 * Each token becomes url("<proxy link>").
 *
 * @return the rewritten block or std::nullopt if nothing was
 * modified
 */
std::optional<std::string>
CssRewriteUrls(std::string_view block, const RewriteContext &ctx) noexcept;
