// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "TimerEvent.hxx"

/**
 * Wrapper for #TimerEvent which aims to simplify installing recurring
 * events.
 */
class CleanupTimer {
	TimerEvent event;

	const std::chrono::steady_clock::duration delay;

	/**
	 * @return true if another cleanup shall be scheduled
	 */
	using Callback = std::function<bool()>;
	const Callback callback;

public:
	CleanupTimer(EventLoop &loop, std::chrono::steady_clock::duration _delay,
		     Callback _callback) noexcept
		:event(loop, [this]{ OnTimer(); }),
		 delay(_delay),
		 callback(std::move(_callback)) {}

	void Enable() noexcept;

	void Disable() noexcept {
		event.Cancel();
	}

private:
	void OnTimer() noexcept;
};
