// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

struct RetryPolicy {
	/**
	 * The maximum number of attempts per provider, including the
	 * first one.  Values below 1 are treated as 1.
	 */
	unsigned max_attempts = 3;

	std::chrono::milliseconds base_delay{100};

	/**
	 * No delay is longer than this.
	 */
	std::chrono::milliseconds max_delay{2000};
};

/**
 * Calculate the delay after the given number of failed attempts:
 * base_delay * 2^(n-1), capped at max_delay, with "equal jitter"
 * (half of the delay is fixed, the other half is random).
 *
 * @param failed_attempts the number of failed attempts so far (at
 * least 1)
 * @param random a random value between 0 and 1
 */
[[gnu::const]]
std::chrono::milliseconds
CalculateBackoff(const RetryPolicy &policy, unsigned failed_attempts,
		 double random) noexcept;

/**
 * Like CalculateBackoff(), but with a random value from a
 * thread-local generator.
 */
std::chrono::milliseconds
CalculateBackoff(const RetryPolicy &policy, unsigned failed_attempts) noexcept;
