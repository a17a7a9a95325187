// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"

#include <functional>

/**
 * Invoke an event callback after a certain amount of time.
 */
class TimerEvent {
	using Callback = std::function<void()>;
	const Callback callback;

	Event event;

public:
	TimerEvent(EventLoop &loop, Callback _callback) noexcept
		:callback(std::move(_callback)),
		 event(loop, -1, 0, OnEvent, this) {}

	bool IsPending() const noexcept {
		return event.IsPending(EV_TIMEOUT);
	}

	void Schedule(std::chrono::steady_clock::duration d) noexcept {
		event.Add(d);
	}

	void Cancel() noexcept {
		event.Delete();
	}

private:
	static void OnEvent(evutil_socket_t, short, void *ctx) noexcept {
		auto &timer = *(TimerEvent *)ctx;
		timer.callback();
	}
};
