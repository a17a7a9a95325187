// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

struct event_base;

/**
 * Wrapper for a struct event_base.
 */
class EventLoop {
	struct event_base *const event_base;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	struct event_base *Get() const noexcept {
		return event_base;
	}

	static std::chrono::steady_clock::time_point SteadyNow() noexcept {
		return std::chrono::steady_clock::now();
	}

	/**
	 * Run the loop until Break() is called or until there are no
	 * more registered events.
	 */
	void Dispatch() noexcept;

	void Break() noexcept;
};
