// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RewriteContext.hxx"
#include "uri/ProxyLink.hxx"
#include "uri/Resolve.hxx"
#include "util/StringCompare.hxx"
#include "util/StringStrip.hxx"

using std::string_view_literals::operator""sv;

/**
 * Is this a reference which does not point to a HTTP resource, such
 * as "data:", "mailto:" or a fragment?
 */
[[gnu::pure]]
static bool
IsSpecialReference(std::string_view reference) noexcept
{
	return IsUnresolvableReference(reference) &&
		!StringStartsWithIgnoreCase(reference, "http://"sv) &&
		!StringStartsWithIgnoreCase(reference, "https://"sv);
}

std::optional<std::string>
RewriteContext::RewriteReference(std::string_view reference) const noexcept
{
	if (!rewrite_special && IsSpecialReference(Strip(reference)))
		return std::nullopt;

	return encoder.Encode(ResolveUri(reference, base_url));
}
