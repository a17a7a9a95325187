// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringParser.hxx"

#include <stdexcept>

#include <stdlib.h>
#include <string.h>

bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0 || strcmp(s, "true") == 0 ||
	    strcmp(s, "1") == 0)
		return true;
	else if (strcmp(s, "no") == 0 || strcmp(s, "false") == 0 ||
		 strcmp(s, "0") == 0)
		return false;
	else
		throw std::runtime_error("Failed to parse boolean; \"yes\" or \"no\" expected");
}

unsigned long
ParseUnsignedLong(const char *s)
{
	if (*s == '-' || *s == 0)
		throw std::runtime_error("Failed to parse number");

	char *endptr;
	auto value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
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
