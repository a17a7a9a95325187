// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Notify.hxx"

#include <cstdint>
#include <system_error>

#include <errno.h>
#include <sys/eventfd.h>
#include <unistd.h>

static int
CreateEventFd()
{
	int fd = eventfd(0, EFD_NONBLOCK|EFD_CLOEXEC);
	if (fd < 0)
		throw std::system_error(errno, std::system_category(),
					"eventfd() failed");
	return fd;
}

Notify::Notify(EventLoop &event_loop, Callback _callback)
	:callback(std::move(_callback)),
	 fd(CreateEventFd()),
	 event(event_loop, fd, EV_READ|EV_PERSIST, EventFdCallback, this)
{
	event.Add();
}

Notify::~Notify() noexcept
{
	event.Delete();
	close(fd);
}

void
Notify::Signal() noexcept
{
	if (!pending.exchange(true)) {
		static constexpr uint64_t value = 1;
		[[maybe_unused]] ssize_t nbytes = write(fd, &value, sizeof(value));
	}
}

void
Notify::EventFdCallback(evutil_socket_t, short, void *ctx) noexcept
{
	auto &notify = *(Notify *)ctx;

	uint64_t value;
	[[maybe_unused]] ssize_t nbytes = read(notify.fd, &value, sizeof(value));

	if (notify.pending.exchange(false))
		notify.callback();
}
