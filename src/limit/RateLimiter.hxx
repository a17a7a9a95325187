// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

struct Identity;

/**
 * Fixed-window request accounting per subject.
 */
class RateLimiter {
public:
	using Clock = std::chrono::steady_clock;

private:
	struct Window {
		Clock::time_point start;
		unsigned count;
	};

	const Clock::duration window;
	const unsigned max_requests;

	mutable std::mutex mutex;

	std::map<std::string, Window, std::less<>> windows;

public:
	/**
	 * @param _max_requests the number of requests admitted per
	 * window; 0 disables the limit
	 */
	RateLimiter(Clock::duration _window, unsigned _max_requests) noexcept
		:window(_window), max_requests(_max_requests) {}

	RateLimiter(const RateLimiter &) = delete;
	RateLimiter &operator=(const RateLimiter &) = delete;

	/**
	 * Account one request.  Throws #RateLimitedError if the
	 * subject has used up its window.
	 */
	void Admit(std::string_view subject, Clock::time_point now);

	void Admit(const Identity &identity, Clock::time_point now);

	/**
	 * Remove the windows which have elapsed.
	 *
	 * @return the number of windows which were removed
	 */
	std::size_t Expire(Clock::time_point now) noexcept;

	[[gnu::pure]]
	std::size_t GetWindowCount() const noexcept;
};
