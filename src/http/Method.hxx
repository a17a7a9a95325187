// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

enum class HttpMethod : uint_least8_t {
	GET,
	HEAD,
	POST,
	PUT,
	DELETE,
	OPTIONS,
	PATCH,
	OTHER,
};

[[gnu::const]]
const char *
http_method_to_string(HttpMethod method) noexcept;
