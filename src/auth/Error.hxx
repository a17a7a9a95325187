// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * No credential was presented.
 */
class UnauthorizedError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The credential was rejected, or could not be verified.
 */
class ForbiddenError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};
