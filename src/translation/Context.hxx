// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

class CancelFlag;

/**
 * Per-request state which is passed down the pipeline: the deadline
 * and the cancellation flag.
 */
struct RequestContext {
	using Clock = std::chrono::steady_clock;

	Clock::time_point deadline = Clock::time_point::max();

	/**
	 * May be nullptr if this request cannot be cancelled.
	 */
	CancelFlag *cancel = nullptr;

	RequestContext() noexcept = default;

	RequestContext(Clock::time_point _deadline, CancelFlag *_cancel) noexcept
		:deadline(_deadline), cancel(_cancel) {}

	/**
	 * Construct a context whose deadline is the given duration
	 * from now.  A zero duration means no deadline.
	 */
	static RequestContext WithTimeout(std::chrono::milliseconds timeout,
					  CancelFlag *cancel) noexcept;

	[[gnu::pure]]
	bool IsCancelled() const noexcept;

	bool IsExpired(Clock::time_point now) const noexcept {
		return now >= deadline;
	}

	/**
	 * Throws #RequestCancelled or #RequestTimeout if this request
	 * shall not continue.
	 */
	void Check(Clock::time_point now) const;

	void Check() const {
		Check(Clock::now());
	}

	/**
	 * Limit a timeout for an external call to the time which is left
	 * until the deadline.  The result is at least one millisecond.
	 */
	[[gnu::pure]]
	std::chrono::milliseconds Clip(std::chrono::milliseconds timeout,
				       Clock::time_point now) const noexcept;

	/**
	 * Sleep for the specified duration, but not past the deadline.
	 * Throws #RequestCancelled or #RequestTimeout.
	 */
	void Sleep(Clock::duration d) const;
};
