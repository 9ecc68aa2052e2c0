// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Escape or unescape HTML entities.  Unescaping understands the
 * predefined XML entities and numeric character references.
 */
extern const struct escape_class html_escape_class;
