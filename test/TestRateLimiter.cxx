// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "limit/RateLimiter.hxx"
#include "limit/Error.hxx"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(RateLimiter, Basic)
{
	RateLimiter limiter(60s, 3);
	const auto now = RateLimiter::Clock::now();

	limiter.Admit("alice", now);
	limiter.Admit("alice", now + 1s);
	limiter.Admit("alice", now + 2s);

	try {
		limiter.Admit("alice", now + 10s);
		FAIL();
	} catch (const RateLimitedError &e) {
		EXPECT_EQ(e.GetRetryAfter(), 50s);
	}

	/* other subjects have their own window */
	limiter.Admit("bob", now + 10s);
}

TEST(RateLimiter, Rollover)
{
	RateLimiter limiter(10s, 1);
	const auto now = RateLimiter::Clock::now();

	limiter.Admit("alice", now);
	EXPECT_THROW(limiter.Admit("alice", now + 9s), RateLimitedError);

	limiter.Admit("alice", now + 10s);
	EXPECT_THROW(limiter.Admit("alice", now + 11s), RateLimitedError);

	/* several windows later; the new window is aligned, so it ends
	   at now+40s */
	limiter.Admit("alice", now + 35s);

	try {
		limiter.Admit("alice", now + 36s);
		FAIL();
	} catch (const RateLimitedError &e) {
		EXPECT_EQ(e.GetRetryAfter(), 4s);
	}
}

TEST(RateLimiter, RetryAfterRoundsUp)
{
	RateLimiter limiter(1s, 1);
	const auto now = RateLimiter::Clock::now();

	limiter.Admit("alice", now);

	try {
		limiter.Admit("alice", now + 100us);
		FAIL();
	} catch (const RateLimitedError &e) {
		EXPECT_EQ(e.GetRetryAfter(), 1000ms);
	}
}

TEST(RateLimiter, Disabled)
{
	RateLimiter limiter(1s, 0);
	const auto now = RateLimiter::Clock::now();

	for (unsigned i = 0; i < 1000; ++i)
		limiter.Admit("alice", now);

	EXPECT_EQ(limiter.GetWindowCount(), 0U);
}

TEST(RateLimiter, Expire)
{
	RateLimiter limiter(10s, 5);
	const auto now = RateLimiter::Clock::now();

	limiter.Admit("alice", now);
	limiter.Admit("bob", now + 5s);
	EXPECT_EQ(limiter.GetWindowCount(), 2U);

	EXPECT_EQ(limiter.Expire(now + 12s), 1U);
	EXPECT_EQ(limiter.GetWindowCount(), 1U);

	EXPECT_EQ(limiter.Expire(now + 15s), 1U);
	EXPECT_EQ(limiter.GetWindowCount(), 0U);
}

/**
 * Concurrent callers must never be admitted more often than the
 * limit allows.
 */
TEST(RateLimiter, Concurrent)
{
	constexpr unsigned N_THREADS = 8, N_ATTEMPTS = 100, LIMIT = 250;

	RateLimiter limiter(1h, LIMIT);
	const auto now = RateLimiter::Clock::now();

	std::atomic_uint admitted{0}, rejected{0};

	std::vector<std::thread> threads;
	for (unsigned i = 0; i < N_THREADS; ++i)
		threads.emplace_back([&]{
			for (unsigned j = 0; j < N_ATTEMPTS; ++j) {
				try {
					limiter.Admit("shared", now);
					++admitted;
				} catch (const RateLimitedError &) {
					++rejected;
				}
			}
		});

	for (auto &t : threads)
		t.join();

	EXPECT_EQ(admitted.load(), LIMIT);
	EXPECT_EQ(rejected.load(), N_THREADS * N_ATTEMPTS - LIMIT);
}
