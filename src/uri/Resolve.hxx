// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Resolve references found in documents against a base URL.
 */

#pragma once

#include <string>
#include <string_view>

/**
 * Does this reference need no resolution, because it is already
 * absolute or uses a scheme which cannot be loaded through the
 * proxy ("data:", "mailto:", "javascript:", "blob:", a fragment)?
 * The reference is expected to be trimmed already.
 */
[[gnu::pure]]
bool
IsUnresolvableReference(std::string_view reference) noexcept;

/**
 * Normalize the given path: drop empty and "." segments and apply
 * ".." segments (which never climb above the root).  The result
 * always begins with a slash; a trailing slash is preserved.
 */
[[gnu::pure]]
std::string
NormalizeUriPath(std::string_view path) noexcept;

/**
 * Convert a (relative) reference to an absolute URL using the given
 * base.  If the reference is already absolute, non-loadable, or if
 * the base URL is not valid, the (whitespace-trimmed) reference is
 * returned unchanged.
 *
 * Query string and fragment of the reference are preserved.  An
 * empty reference (after trimming) refers to the base document
 * itself: the result is the base URL without its fragment.
 */
[[gnu::pure]]
std::string
ResolveUri(std::string_view reference, std::string_view base) noexcept;
