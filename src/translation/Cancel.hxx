// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * A flag which is set by the main thread when a request shall be
 * abandoned.  Worker threads poll it and use WaitFor() for
 * interruptible sleeps.
 */
class CancelFlag {
	std::mutex mutex;
	std::condition_variable cond;

	std::atomic_bool cancelled{false};

public:
	/**
	 * May be called from any thread.
	 */
	void Cancel() noexcept;

	bool IsCancelled() const noexcept {
		return cancelled.load(std::memory_order_relaxed);
	}

	/**
	 * Sleep for the specified duration or until Cancel() is called.
	 *
	 * @return false if the flag was cancelled
	 */
	bool WaitFor(std::chrono::steady_clock::duration d) noexcept;
};
