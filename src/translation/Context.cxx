// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Context.hxx"
#include "Cancel.hxx"
#include "Error.hxx"

#include <algorithm>
#include <thread>

RequestContext
RequestContext::WithTimeout(std::chrono::milliseconds timeout,
			    CancelFlag *cancel) noexcept
{
	if (timeout.count() <= 0)
		return {Clock::time_point::max(), cancel};

	return {Clock::now() + timeout, cancel};
}

bool
RequestContext::IsCancelled() const noexcept
{
	return cancel != nullptr && cancel->IsCancelled();
}

void
RequestContext::Check(Clock::time_point now) const
{
	if (IsCancelled())
		throw RequestCancelled();

	if (IsExpired(now))
		throw RequestTimeout();
}

std::chrono::milliseconds
RequestContext::Clip(std::chrono::milliseconds timeout,
		     Clock::time_point now) const noexcept
{
	if (deadline == Clock::time_point::max())
		return timeout;

	if (now >= deadline)
		return std::chrono::milliseconds{1};

	const auto remaining =
		std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
	if (timeout.count() <= 0)
		return remaining;

	return std::max(std::min(timeout, remaining),
			std::chrono::milliseconds{1});
}

void
RequestContext::Sleep(Clock::duration d) const
{
	const auto now = Clock::now();
	if (deadline != Clock::time_point::max() && now + d > deadline)
		d = deadline > now ? deadline - now : Clock::duration::zero();

	if (cancel != nullptr) {
		if (!cancel->WaitFor(d))
			throw RequestCancelled();
	} else
		std::this_thread::sleep_for(d);

	Check();
}
