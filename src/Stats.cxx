// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Stats.hxx"
#include "Logger.hxx"

using std::string_view_literals::operator""sv;

static inline void
Increment(std::atomic<uint64_t> &counter, uint64_t delta=1) noexcept
{
	counter.fetch_add(delta, std::memory_order_relaxed);
}

void
Stats::OnCacheHit() noexcept
{
	Increment(cache_hits);
}

void
Stats::OnCacheMiss() noexcept
{
	Increment(cache_misses);
}

void
Stats::OnCacheError() noexcept
{
	Increment(cache_errors);
}

void
Stats::OnProviderCall(std::string_view, std::chrono::milliseconds latency,
		      ProviderCallOutcome outcome) noexcept
{
	Increment(provider_calls);
	Increment(provider_latency_ms, latency.count());

	switch (outcome) {
	case ProviderCallOutcome::SUCCESS:
		break;

	case ProviderCallOutcome::TRANSIENT_ERROR:
		Increment(provider_transient_errors);
		break;

	case ProviderCallOutcome::PERMANENT_ERROR:
		Increment(provider_permanent_errors);
		break;
	}
}

void
Stats::OnRejected(std::string_view kind) noexcept
{
	if (kind == "unauthorized"sv)
		Increment(rejected_unauthorized);
	else if (kind == "forbidden"sv)
		Increment(rejected_forbidden);
	else if (kind == "rate_limited"sv)
		Increment(rejected_rate_limited);
	else if (kind == "validation"sv)
		Increment(rejected_validation);
}

void
Stats::Log(const Logger &logger) const noexcept
{
	const auto load = [](const Counter &c){
		return c.load(std::memory_order_relaxed);
	};

	logger(3, "requests=", load(http_requests),
	       " cache_hits=", load(cache_hits),
	       " cache_misses=", load(cache_misses),
	       " cache_errors=", load(cache_errors));

	const uint64_t calls = load(provider_calls);
	logger(3, "provider_calls=", calls,
	       " transient_errors=", load(provider_transient_errors),
	       " permanent_errors=", load(provider_permanent_errors),
	       " avg_latency_ms=", calls > 0 ? load(provider_latency_ms) / calls : 0);

	logger(3, "rejected unauthorized=", load(rejected_unauthorized),
	       " forbidden=", load(rejected_forbidden),
	       " rate_limited=", load(rejected_rate_limited),
	       " validation=", load(rejected_validation));
}
