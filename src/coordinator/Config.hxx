// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Backoff.hxx"

#include <chrono>

struct CoordinatorConfig {
	std::chrono::seconds cache_ttl{3600};

	/**
	 * The maximum number of cache misses per provider call; 0 means
	 * no limit.
	 */
	unsigned max_units_per_call = 16;

	/**
	 * The timeout of one provider call.  It is clipped to the time
	 * left until the request deadline.
	 */
	std::chrono::milliseconds provider_timeout{10000};

	RetryPolicy retry;
};
