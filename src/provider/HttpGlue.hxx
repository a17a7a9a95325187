// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>

class HttpClient;
struct HttpClientRequest;

/**
 * Send a request to an HTTP backend and parse the JSON response.
 *
 * Throws #ProviderError: transport failures and the status codes
 * 408, 429 and 5xx are transient, other error statuses and
 * malformed responses are permanent.  Throws #RequestCancelled if
 * the request was cancelled.
 */
nlohmann::json
RequestJson(HttpClient &client, std::string_view provider_id,
	    const HttpClientRequest &request);

/**
 * Build a backend URL from the configured base URL and a path.
 */
[[gnu::pure]]
std::string
JoinUrl(std::string_view base, std::string_view path) noexcept;

/**
 * Convert a backend language code to the lower-case form used by
 * this gateway.
 */
[[gnu::pure]]
std::string
NormalizeLanguageCode(std::string_view code) noexcept;
