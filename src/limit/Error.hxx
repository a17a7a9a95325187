// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <stdexcept>

/**
 * The caller has exceeded its request limit.
 */
class RateLimitedError : public std::runtime_error {
	std::chrono::milliseconds retry_after;

public:
	explicit RateLimitedError(std::chrono::milliseconds _retry_after)
		:std::runtime_error("Rate limit exceeded"),
		 retry_after(_retry_after) {}

	/**
	 * The time until the current window ends.
	 */
	std::chrono::milliseconds GetRetryAfter() const noexcept {
		return retry_after;
	}
};
