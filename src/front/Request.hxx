// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Method.hxx"
#include "http/Status.hxx"

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * An incoming HTTP request, copied out of the HTTP server library so
 * it can be handled in a worker thread.
 */
struct GatewayRequest {
	HttpMethod method = HttpMethod::GET;

	/**
	 * The URI path without the query string.
	 */
	std::string path;

	/**
	 * The "Authorization" header; std::nullopt if there is none.
	 */
	std::optional<std::string> authorization;

	std::string content_type;

	std::string body;
};

struct GatewayResponse {
	HttpStatus status = HttpStatus::OK;

	std::string content_type = "application/json";

	/**
	 * Additional response headers.
	 */
	std::vector<std::pair<std::string, std::string>> headers;

	std::string body;

	void AddHeader(std::string name, std::string value) {
		headers.emplace_back(std::move(name), std::move(value));
	}

	/**
	 * Look up a response header (case-sensitive).
	 *
	 * @return nullptr if the header does not exist
	 */
	[[gnu::pure]]
	const std::string *FindHeader(std::string_view name) const noexcept {
		for (const auto &[n, v] : headers)
			if (n == name)
				return &v;
		return nullptr;
	}
};
