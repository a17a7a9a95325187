// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Listener for shutdown signals (SIGTERM, SIGINT, SIGQUIT).
 */

#include "ShutdownListener.hxx"

#include <fmt/core.h>

#include <signal.h>
#include <stdio.h>
#include <unistd.h>

ShutdownListener::ShutdownListener(EventLoop &loop, Callback _callback) noexcept
	:sigterm(loop, SIGTERM, EV_SIGNAL|EV_PERSIST, SignalCallback, this),
	 sigint(loop, SIGINT, EV_SIGNAL|EV_PERSIST, SignalCallback, this),
	 sigquit(loop, SIGQUIT, EV_SIGNAL|EV_PERSIST, SignalCallback, this),
	 callback(std::move(_callback))
{
}

void
ShutdownListener::Enable() noexcept
{
	sigterm.Add();
	sigint.Add();
	sigquit.Add();
}

void
ShutdownListener::Disable() noexcept
{
	sigterm.Delete();
	sigint.Delete();
	sigquit.Delete();
}

void
ShutdownListener::SignalCallback(evutil_socket_t signo, short, void *ctx) noexcept
{
	auto &listener = *(ShutdownListener *)ctx;

	fmt::print(stderr, "caught signal {}, shutting down (pid={})\n",
		   int(signo), int(getpid()));

	listener.Disable();
	listener.callback();
}
