// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * The request was malformed or violates a limit.  This is never
 * retried.
 */
class ValidationError : public std::runtime_error {
	std::string field;

public:
	ValidationError(std::string_view _field, std::string_view reason);

	const std::string &GetField() const noexcept {
		return field;
	}
};

/**
 * The request was cancelled, usually because the client has closed
 * the connection.
 */
class RequestCancelled : public std::runtime_error {
public:
	RequestCancelled()
		:std::runtime_error("Request cancelled") {}
};

/**
 * The request has exceeded its deadline.
 */
class RequestTimeout : public std::runtime_error {
public:
	RequestTimeout()
		:std::runtime_error("Request timed out") {}
};
