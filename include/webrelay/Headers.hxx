// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for forwarding upstream response headers to the
 * client.
 */

#pragma once

#include <cstdint>

namespace WebRelay {

/**
 * What happens to a specific upstream response header?
 */
enum class HeaderDisposition : uint8_t {
	/**
	 * Forward it as-is.
	 */
	FORWARD,

	/**
	 * Do not forward at all.  This applies to headers which would
	 * break the rewritten page (security policies which forbid
	 * framing or loading from the proxy's origin) and to headers
	 * describing the upstream transfer encoding, which do not
	 * apply to the rewritten body.
	 */
	DROP,

	/**
	 * Forward it, but rewrite the URI in its value so that it
	 * points to the proxy.  Example: "Location".
	 */
	REWRITE,
};

} // namespace WebRelay
