// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parse configuration values.  All functions throw
 * std::runtime_error on error.
 */

#pragma once

/**
 * Parse "yes" or "no".
 */
bool
ParseBool(const char *s);

unsigned long
ParseUnsignedLong(const char *s);

/**
 * Parse a number which must be greater than zero and not greater
 * than the given maximum.
 */
unsigned long
ParsePositiveLong(const char *s, unsigned long max_value);
