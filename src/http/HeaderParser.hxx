// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parse a raw HTTP header block into a HeaderList.
 */

#pragma once

#include "HeaderList.hxx"

#include <string_view>

[[gnu::pure]]
bool
http_header_name_valid(std::string_view name) noexcept;

/**
 * Parse one "Name: value" line and append it to the list.  The
 * value is stripped of surrounding whitespace, and whitespace
 * between name and colon is ignored.
 *
 * @return true on success, false if the line is malformed
 */
bool
header_parse_line(HeaderList &headers, std::string_view line) noexcept;

/**
 * Parse a header block as received from a HTTP server.  Lines may
 * be terminated by CR, LF or CRLF; status lines ("HTTP/...") and
 * malformed lines are skipped.
 */
HeaderList
header_parse_buffer(std::string_view src) noexcept;
