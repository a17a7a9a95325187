// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Logger.hxx"

#include <cstdint>
#include <string_view>

struct Identity;

enum class AuthFailure : uint_least8_t {
	/**
	 * No bearer credential was presented.
	 */
	MISSING,

	/**
	 * The credential store does not know the key.
	 */
	UNKNOWN,

	/**
	 * The credential store has failed.
	 */
	STORE_ERROR,

	/**
	 * The credential store did not answer in time.
	 */
	TIMEOUT,
};

[[gnu::const]]
const char *
ToString(AuthFailure failure) noexcept;

/**
 * Receives the outcome of each authentication attempt.
 */
class AuditHandler {
public:
	virtual ~AuditHandler() noexcept = default;

	virtual void OnAuthenticated(const Identity &identity) noexcept = 0;

	/**
	 * @param key_hash the hash of the rejected key; empty if there
	 * was none
	 */
	virtual void OnAuthenticationFailed(AuthFailure failure,
					    std::string_view key_hash) noexcept = 0;
};

/**
 * An #AuditHandler which writes the events to the log.
 */
class LoggingAuditHandler final : public AuditHandler {
	const Logger logger{"audit"};

public:
	void OnAuthenticated(const Identity &identity) noexcept override;
	void OnAuthenticationFailed(AuthFailure failure,
				    std::string_view key_hash) noexcept override;
};
