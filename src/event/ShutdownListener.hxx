// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Listener for shutdown signals (SIGTERM, SIGINT, SIGQUIT).
 */

#pragma once

#include "Event.hxx"

#include <functional>

class ShutdownListener {
	Event sigterm, sigint, sigquit;

	using Callback = std::function<void()>;
	const Callback callback;

public:
	ShutdownListener(EventLoop &loop, Callback _callback) noexcept;

	ShutdownListener(const ShutdownListener &) = delete;
	ShutdownListener &operator=(const ShutdownListener &) = delete;

	void Enable() noexcept;
	void Disable() noexcept;

private:
	static void SignalCallback(evutil_socket_t signo, short events,
				   void *ctx) noexcept;
};
