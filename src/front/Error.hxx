// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>

struct GatewayResponse;

/**
 * Convert a C++ exception to an HTTP error response with a JSON
 * body.
 *
 * @param verbose include the exception message in "500 Internal
 * Server Error" responses
 */
GatewayResponse
ErrorToResponse(std::exception_ptr ep, bool verbose);

/**
 * Is this an internal error, i.e. one which was not caused by the
 * client or a provider and deserves to be logged as an error?
 */
[[gnu::pure]]
bool
IsInternalError(std::exception_ptr ep) noexcept;
