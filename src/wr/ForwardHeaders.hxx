// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "webrelay/Headers.hxx"
#include "http/HeaderList.hxx"

#include <string_view>

class ProxyLinkEncoder;

/**
 * Decide what happens to an upstream response header.  The name is
 * compared case-insensitively.
 */
[[gnu::pure]]
WebRelay::HeaderDisposition
ClassifyResponseHeader(std::string_view name) noexcept;

/**
 * Build the list of response headers to be sent to the client from
 * the raw header block received from the upstream server.
 *
 * @param raw_headers the header block of the final upstream
 * response, status line included
 * @param effective_url the URL the response was finally received
 * from (after following redirects); "Location" values are resolved
 * against it
 * @param content_type the content type declared by the upstream
 * response (empty if none); if set, it replaces all upstream
 * "Content-Type" headers and is emitted last
 */
HeaderList
ForwardResponseHeaders(std::string_view raw_headers,
		       std::string_view effective_url,
		       std::string_view content_type,
		       const ProxyLinkEncoder &encoder) noexcept;
