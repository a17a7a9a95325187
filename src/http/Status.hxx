// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

enum class HttpStatus : uint_least16_t {
	OK = 200,
	NO_CONTENT = 204,

	BAD_REQUEST = 400,
	UNAUTHORIZED = 401,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	REQUEST_TIMEOUT = 408,
	REQUEST_ENTITY_TOO_LARGE = 413,
	UNSUPPORTED_MEDIA_TYPE = 415,
	TOO_MANY_REQUESTS = 429,

	INTERNAL_SERVER_ERROR = 500,
	NOT_IMPLEMENTED = 501,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
	GATEWAY_TIMEOUT = 504,
};

constexpr bool
http_status_is_success(HttpStatus status) noexcept
{
	return static_cast<unsigned>(status) >= 200 &&
		static_cast<unsigned>(status) < 300;
}

constexpr bool
http_status_is_client_error(HttpStatus status) noexcept
{
	return static_cast<unsigned>(status) >= 400 &&
		static_cast<unsigned>(status) < 500;
}

constexpr bool
http_status_is_server_error(HttpStatus status) noexcept
{
	return static_cast<unsigned>(status) >= 500 &&
		static_cast<unsigned>(status) < 600;
}
