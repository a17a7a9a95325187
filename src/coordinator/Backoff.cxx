// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Backoff.hxx"

#include <algorithm>
#include <random>

std::chrono::milliseconds
CalculateBackoff(const RetryPolicy &policy, unsigned failed_attempts,
		 double random) noexcept
{
	if (failed_attempts < 1)
		failed_attempts = 1;

	const auto base = policy.base_delay.count();
	const auto max = policy.max_delay.count();
	if (base <= 0 || max <= 0)
		return {};

	/* double until the cap is reached; this avoids overflowing the
	   shift */
	auto delay = base;
	for (unsigned i = 1; i < failed_attempts && delay < max; ++i)
		delay *= 2;
	delay = std::min(delay, max);

	random = std::clamp(random, 0., 1.);

	const auto half = delay / 2;
	return std::chrono::milliseconds(half + static_cast<long long>((delay - half) * random));
}

std::chrono::milliseconds
CalculateBackoff(const RetryPolicy &policy, unsigned failed_attempts) noexcept
{
	thread_local std::minstd_rand generator{std::random_device{}()};
	std::uniform_real_distribution<double> distribution{0., 1.};

	return CalculateBackoff(policy, failed_attempts, distribution(generator));
}
