// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escape/unescape into a newly allocated std::string.
 */

#pragma once

#include <string>
#include <string_view>

struct escape_class;

[[gnu::pure]]
std::string
UnescapeToString(const struct escape_class &cls, std::string_view p) noexcept;

[[gnu::pure]]
std::string
EscapeToString(const struct escape_class &cls, std::string_view p) noexcept;
