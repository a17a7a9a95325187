// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Method.hxx"

const char *
http_method_to_string(HttpMethod method) noexcept
{
	switch (method) {
	case HttpMethod::GET:
		return "GET";

	case HttpMethod::HEAD:
		return "HEAD";

	case HttpMethod::POST:
		return "POST";

	case HttpMethod::PUT:
		return "PUT";

	case HttpMethod::DELETE:
		return "DELETE";

	case HttpMethod::OPTIONS:
		return "OPTIONS";

	case HttpMethod::PATCH:
		return "PATCH";

	case HttpMethod::OTHER:
		break;
	}

	return "OTHER";
}
