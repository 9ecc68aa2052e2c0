// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringParser.hxx"
#include "StringAPI.hxx"

#include <stdexcept>

#include <stdlib.h>

bool
ParseBool(const char *s)
{
	if (StringIsEqual(s, "yes"))
		return true;
	else if (StringIsEqual(s, "no"))
		return false;
	else
		throw std::runtime_error("yes/no expected");
}

unsigned long
ParseUnsignedLong(const char *s)
{
	char *endptr;
	const auto value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-')
		throw std::runtime_error("Failed to parse number");

	return value;
}

unsigned long
ParsePositiveLong(const char *s, unsigned long max_value)
{
	const auto value = ParseUnsignedLong(s);
	if (value <= 0)
		throw std::runtime_error("Value must be positive");

	if (value > max_value)
		throw std::runtime_error("Value is too large");

	return value;
}
