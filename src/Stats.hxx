// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "MetricsHandler.hxx"

#include <atomic>
#include <cstdint>

class Logger;

/**
 * Process-wide counters, fed by the #MetricsHandler hooks.
 */
class Stats final : public MetricsHandler {
	using Counter = std::atomic<uint64_t>;

public:
	Counter http_requests{0};

	Counter cache_hits{0}, cache_misses{0}, cache_errors{0};

	Counter provider_calls{0};
	Counter provider_transient_errors{0}, provider_permanent_errors{0};

	/**
	 * The sum of the latencies of all provider calls in
	 * milliseconds.
	 */
	Counter provider_latency_ms{0};

	Counter rejected_unauthorized{0}, rejected_forbidden{0};
	Counter rejected_rate_limited{0}, rejected_validation{0};

	void AddRequest() noexcept {
		http_requests.fetch_add(1, std::memory_order_relaxed);
	}

	void Log(const Logger &logger) const noexcept;

	/* virtual methods from class MetricsHandler */
	void OnCacheHit() noexcept override;
	void OnCacheMiss() noexcept override;
	void OnCacheError() noexcept override;
	void OnProviderCall(std::string_view provider_id,
			    std::chrono::milliseconds latency,
			    ProviderCallOutcome outcome) noexcept override;
	void OnRejected(std::string_view kind) noexcept override;
};
