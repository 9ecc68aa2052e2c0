// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

#include <assert.h>
#include <stddef.h>

/**
 * A set of functions which escape and unescape strings for one
 * specific syntax (e.g. HTML attribute values).
 */
struct escape_class {
	/**
	 * Find the first character that must be unescaped.  Returns nullptr
	 * when the string can be used as-is without unescaping.
	 */
	const char *(*unescape_find)(std::string_view p) noexcept;

	/**
	 * Unescape the given string into the output buffer, which
	 * must be at least as large as the input.  Returns the number
	 * of characters in the output buffer.
	 */
	size_t (*unescape)(std::string_view p, char *q) noexcept;

	/**
	 * Find the first character that must be escaped.  Returns nullptr
	 * when there are no such characters.
	 */
	const char *(*escape_find)(std::string_view p) noexcept;

	/**
	 * Measure the buffer size for escaping the given string.
	 */
	size_t (*escape_size)(std::string_view p) noexcept;

	/**
	 * Escape the given string into the output buffer.  Returns the
	 * number of characters in the output buffer.
	 */
	size_t (*escape)(std::string_view p, char *q) noexcept;
};

[[gnu::pure]]
static inline const char *
unescape_find(const struct escape_class &cls, std::string_view p) noexcept
{
	assert(cls.unescape_find != nullptr);

	return cls.unescape_find(p);
}

[[gnu::pure]]
static inline const char *
escape_find(const struct escape_class &cls, std::string_view p) noexcept
{
	assert(cls.escape_find != nullptr);

	return cls.escape_find(p);
}
