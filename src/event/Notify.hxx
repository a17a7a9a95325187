// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Event.hxx"

#include <atomic>
#include <functional>

/**
 * Send notifications from a worker thread to the main thread.
 */
class Notify {
	using Callback = std::function<void()>;
	const Callback callback;

	const int fd;

	Event event;

	std::atomic_bool pending{false};

public:
	/**
	 * Throws on error.
	 */
	Notify(EventLoop &event_loop, Callback _callback);
	~Notify() noexcept;

	Notify(const Notify &) = delete;
	Notify &operator=(const Notify &) = delete;

	void Enable() noexcept {
		event.Add();
	}

	void Disable() noexcept {
		event.Delete();
	}

	/**
	 * May be called from any thread.
	 */
	void Signal() noexcept;

private:
	static void EventFdCallback(evutil_socket_t fd, short events,
				    void *ctx) noexcept;
};
