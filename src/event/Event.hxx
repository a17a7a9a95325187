// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Loop.hxx"

#include <event2/event.h>
#include <event2/event_struct.h>

#include <chrono>

/**
 * Wrapper for a struct event.
 */
class Event {
	struct event event;

public:
	Event(EventLoop &loop, evutil_socket_t fd, short mask,
	      event_callback_fn callback, void *ctx) noexcept {
		::event_assign(&event, loop.Get(), fd, mask, callback, ctx);
	}

	~Event() noexcept {
		Delete();
	}

	Event(const Event &other) = delete;
	Event &operator=(const Event &other) = delete;

	[[gnu::pure]]
	evutil_socket_t GetFd() const noexcept {
		return event_get_fd(&event);
	}

	bool Add(const struct timeval *timeout=nullptr) noexcept {
		return ::event_add(&event, timeout) == 0;
	}

	bool Add(std::chrono::steady_clock::duration d) noexcept {
		const auto us = std::chrono::duration_cast<std::chrono::microseconds>(d).count();
		const struct timeval tv{
			.tv_sec = time_t(us / 1000000),
			.tv_usec = suseconds_t(us % 1000000),
		};
		return Add(&tv);
	}

	void Delete() noexcept {
		::event_del(&event);
	}

	[[gnu::pure]]
	bool IsPending(short events) const noexcept {
		return ::event_pending(&event, events, nullptr);
	}
};
