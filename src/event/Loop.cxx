// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Loop.hxx"

#include <event2/event.h>

#include <stdexcept>

static struct event_base *
CreateEventBase()
{
	struct event_base *base = event_base_new();
	if (base == nullptr)
		throw std::runtime_error("event_base_new() failed");
	return base;
}

EventLoop::EventLoop()
	:event_base(CreateEventBase()) {}

EventLoop::~EventLoop() noexcept
{
	event_base_free(event_base);
}

void
EventLoop::Dispatch() noexcept
{
	event_base_dispatch(event_base);
}

void
EventLoop::Break() noexcept
{
	event_base_loopbreak(event_base);
}
