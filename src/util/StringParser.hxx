// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parsers for configuration values.  All functions throw
 * std::runtime_error on error.
 */

#pragma once

bool
ParseBool(const char *s);

unsigned long
ParseUnsignedLong(const char *s);

/**
 * Parse a number between 1 and #max_value.
 */
unsigned long
ParsePositiveLong(const char *s, unsigned long max_value);
