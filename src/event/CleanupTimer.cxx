// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CleanupTimer.hxx"

void
CleanupTimer::OnTimer() noexcept
{
	if (callback())
		Enable();
}

void
CleanupTimer::Enable() noexcept
{
	if (!event.IsPending())
		event.Schedule(delay);
}
