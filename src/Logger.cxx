// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/core.h>

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_verbosity{1};

bool
Logger::IsLevelVisible(unsigned level) noexcept
{
	return level <= log_verbosity.load(std::memory_order_relaxed);
}

void
Logger::SetVerbosity(unsigned _verbosity) noexcept
{
	log_verbosity.store(_verbosity, std::memory_order_relaxed);
}

unsigned
Logger::GetVerbosity() noexcept
{
	return log_verbosity.load(std::memory_order_relaxed);
}

void
Logger::Emit(std::string_view msg) const noexcept
{
	fmt::print(stderr, "[{}] {}\n", domain, msg);
}
