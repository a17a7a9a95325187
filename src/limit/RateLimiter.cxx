// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RateLimiter.hxx"
#include "Error.hxx"
#include "auth/Identity.hxx"

void
RateLimiter::Admit(std::string_view subject, Clock::time_point now)
{
	if (max_requests == 0)
		return;

	const std::scoped_lock lock{mutex};

	auto i = windows.find(subject);
	if (i == windows.end()) {
		windows.emplace(std::string{subject}, Window{now, 1});
		return;
	}

	Window &w = i->second;
	if (now - w.start >= window) {
		/* the window has elapsed: start a new one aligned to the
		   window size */
		const auto n = (now - w.start) / window;
		w.start += n * window;
		w.count = 0;
	}

	if (w.count >= max_requests) {
		const auto remaining = w.start + window - now;
		throw RateLimitedError(std::chrono::ceil<std::chrono::milliseconds>(remaining));
	}

	++w.count;
}

void
RateLimiter::Admit(const Identity &identity, Clock::time_point now)
{
	Admit(identity.subject, now);
}

std::size_t
RateLimiter::Expire(Clock::time_point now) noexcept
{
	const std::scoped_lock lock{mutex};

	return std::erase_if(windows, [this, now](const auto &i){
		return now - i.second.start >= window;
	});
}

std::size_t
RateLimiter::GetWindowCount() const noexcept
{
	const std::scoped_lock lock{mutex};
	return windows.size();
}
