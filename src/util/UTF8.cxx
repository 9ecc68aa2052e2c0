// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UTF8.hxx"

char *
UnicodeToUTF8(uint_least32_t ch, char *q) noexcept
{
	if (ch < 0x80) {
		*q++ = (char)ch;
	} else if (ch < 0x800) {
		*q++ = (char)(0xc0 | (ch >> 6));
		*q++ = (char)(0x80 | (ch & 0x3f));
	} else if (ch < 0x10000) {
		*q++ = (char)(0xe0 | (ch >> 12));
		*q++ = (char)(0x80 | ((ch >> 6) & 0x3f));
		*q++ = (char)(0x80 | (ch & 0x3f));
	} else {
		*q++ = (char)(0xf0 | (ch >> 18));
		*q++ = (char)(0x80 | ((ch >> 12) & 0x3f));
		*q++ = (char)(0x80 | ((ch >> 6) & 0x3f));
		*q++ = (char)(0x80 | (ch & 0x3f));
	}

	return q;
}
