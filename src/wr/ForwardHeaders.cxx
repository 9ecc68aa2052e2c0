// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ForwardHeaders.hxx"
#include "http/HeaderParser.hxx"
#include "uri/ProxyLink.hxx"
#include "uri/Resolve.hxx"
#include "util/CharUtil.hxx"
#include "util/StringCompare.hxx"

#include <cstdint>

using std::string_view_literals::operator""sv;
using WebRelay::HeaderDisposition;

HeaderDisposition
ClassifyResponseHeader(std::string_view name) noexcept
{
	if (name.empty())
		return HeaderDisposition::DROP;

	switch (ToLowerASCII(name.front())) {
	case 'c':
		if (StringIsEqualIgnoreCase(name, "content-security-policy"sv) ||
		    /* the body is forwarded decoded, with a new
		       length */
		    StringIsEqualIgnoreCase(name, "content-length"sv) ||
		    StringIsEqualIgnoreCase(name, "content-encoding"sv))
			return HeaderDisposition::DROP;

		break;

	case 'l':
		if (StringIsEqualIgnoreCase(name, "location"sv))
			return HeaderDisposition::REWRITE;

		break;

	case 's':
		if (StringIsEqualIgnoreCase(name, "strict-transport-security"sv))
			return HeaderDisposition::DROP;

		break;

	case 't':
		if (StringIsEqualIgnoreCase(name, "transfer-encoding"sv))
			return HeaderDisposition::DROP;

		break;

	case 'x':
		if (StringIsEqualIgnoreCase(name, "x-frame-options"sv))
			return HeaderDisposition::DROP;

		break;
	}

	return HeaderDisposition::FORWARD;
}

HeaderList
ForwardResponseHeaders(std::string_view raw_headers,
		       std::string_view effective_url,
		       std::string_view content_type,
		       const ProxyLinkEncoder &encoder) noexcept
{
	HeaderList dest;

	/* index of the "Location" header in #dest; a later upstream
	   "Location" replaces the value of an earlier one */
	std::size_t location = SIZE_MAX;

	for (auto &[name, value] : header_parse_buffer(raw_headers)) {
		switch (ClassifyResponseHeader(name)) {
		case HeaderDisposition::DROP:
			continue;

		case HeaderDisposition::REWRITE:
			value = encoder.Encode(ResolveUri(value, effective_url));

			if (location == SIZE_MAX) {
				location = dest.size();
				dest.emplace_back("Location", std::move(value));
			} else
				dest[location].second = std::move(value);

			continue;

		case HeaderDisposition::FORWARD:
			break;
		}

		if (!content_type.empty() &&
		    StringIsEqualIgnoreCase(name, "content-type"sv))
			/* superseded by the declared content type */
			continue;

		dest.emplace_back(std::move(name), std::move(value));
	}

	if (!content_type.empty())
		dest.emplace_back("Content-Type", content_type);

	return dest;
}
