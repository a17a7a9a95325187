// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <stdexcept>

enum class HttpStatus : uint_least16_t;

/**
 * An exception which can be thrown to indicate that a certain HTTP
 * response shall be sent to our HTTP client.
 */
class HttpMessageResponse : public std::runtime_error {
	HttpStatus status;

	/**
	 * The machine-readable error kind for the response body.
	 */
	const char *kind;

public:
	HttpMessageResponse(HttpStatus _status, const char *_kind,
			    const char *_msg)
		:std::runtime_error(_msg), status(_status), kind(_kind) {}

	HttpStatus GetStatus() const noexcept {
		return status;
	}

	const char *GetKind() const noexcept {
		return kind;
	}
};
