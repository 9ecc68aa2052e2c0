// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * Encode the specified Unicode character as UTF-8 and write it to
 * the buffer, which must have room for at least 4 bytes.
 *
 * @return a pointer to the buffer plus the added bytes
 */
char *
UnicodeToUTF8(uint_least32_t ch, char *q) noexcept;
