// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

enum class HttpStatus : uint_least16_t;

enum class ProviderErrorKind : uint_least8_t {
	/**
	 * A temporary failure (timeout, connection reset, overload);
	 * the call may be retried.
	 */
	TRANSIENT,

	/**
	 * The request cannot succeed (unsupported language pair, quota
	 * exceeded, malformed glossary, malformed response).
	 */
	PERMANENT,
};

[[gnu::const]]
const char *
ToString(ProviderErrorKind kind) noexcept;

class ProviderError : public std::runtime_error {
	std::string provider_id;

	ProviderErrorKind kind;

public:
	ProviderError(ProviderErrorKind _kind, std::string_view _provider_id,
		      const std::string &msg)
		:std::runtime_error(msg),
		 provider_id(_provider_id), kind(_kind) {}

	const std::string &GetProviderId() const noexcept {
		return provider_id;
	}

	ProviderErrorKind GetKind() const noexcept {
		return kind;
	}

	bool IsRetryable() const noexcept {
		return kind == ProviderErrorKind::TRANSIENT;
	}
};

/**
 * Classify an error status returned by an HTTP backend: 408, 429 and
 * 5xx are transient, everything else is permanent.
 */
[[gnu::const]]
ProviderErrorKind
ClassifyHttpStatus(HttpStatus status) noexcept;
