// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "coordinator/Backoff.hxx"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(Backoff, Exponential)
{
	const RetryPolicy policy{
		.max_attempts = 5,
		.base_delay = 100ms,
		.max_delay = 2000ms,
	};

	/* the upper bound doubles with each attempt */
	EXPECT_EQ(CalculateBackoff(policy, 1, 1.), 100ms);
	EXPECT_EQ(CalculateBackoff(policy, 2, 1.), 200ms);
	EXPECT_EQ(CalculateBackoff(policy, 3, 1.), 400ms);
	EXPECT_EQ(CalculateBackoff(policy, 4, 1.), 800ms);

	/* half of it is fixed */
	EXPECT_EQ(CalculateBackoff(policy, 1, 0.), 50ms);
	EXPECT_EQ(CalculateBackoff(policy, 3, 0.), 200ms);
}

TEST(Backoff, Cap)
{
	const RetryPolicy policy{
		.max_attempts = 100,
		.base_delay = 100ms,
		.max_delay = 2000ms,
	};

	EXPECT_EQ(CalculateBackoff(policy, 6, 1.), 2000ms);
	EXPECT_EQ(CalculateBackoff(policy, 64, 1.), 2000ms);
	EXPECT_EQ(CalculateBackoff(policy, 1000, 0.), 1000ms);
}

TEST(Backoff, Jitter)
{
	const RetryPolicy policy;

	for (unsigned attempt = 1; attempt <= 8; ++attempt) {
		const auto lower = CalculateBackoff(policy, attempt, 0.);
		const auto upper = CalculateBackoff(policy, attempt, 1.);

		for (unsigned i = 0; i < 32; ++i) {
			const auto delay = CalculateBackoff(policy, attempt);
			EXPECT_GE(delay, lower);
			EXPECT_LE(delay, upper);
		}
	}
}

TEST(Backoff, Disabled)
{
	const RetryPolicy policy{
		.max_attempts = 3,
		.base_delay = 0ms,
		.max_delay = 0ms,
	};

	EXPECT_EQ(CalculateBackoff(policy, 1, 0.5), 0ms);
}
