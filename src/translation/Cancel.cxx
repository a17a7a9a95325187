// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Cancel.hxx"

void
CancelFlag::Cancel() noexcept
{
	const std::scoped_lock lock{mutex};
	cancelled.store(true, std::memory_order_relaxed);
	cond.notify_all();
}

bool
CancelFlag::WaitFor(std::chrono::steady_clock::duration d) noexcept
{
	std::unique_lock lock{mutex};
	return !cond.wait_for(lock, d, [this]{ return IsCancelled(); });
}
