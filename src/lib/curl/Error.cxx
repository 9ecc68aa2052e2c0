// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <fmt/core.h>

namespace Curl {

CurlError
MakeError(CURLcode code, const char *prefix) noexcept
{
	const auto msg = fmt::format("{}: {}", prefix,
				     curl_easy_strerror(code));
	return {code, msg.c_str()};
}

} // namespace Curl
