// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

enum class ProviderCallOutcome : uint_least8_t {
	SUCCESS,
	TRANSIENT_ERROR,
	PERMANENT_ERROR,
};

/**
 * Hooks which are invoked by the request pipeline.  All methods may
 * be called from any thread.  The default implementations do
 * nothing.
 */
class MetricsHandler {
public:
	virtual ~MetricsHandler() noexcept = default;

	virtual void OnCacheHit() noexcept {}
	virtual void OnCacheMiss() noexcept {}

	/**
	 * A cache operation has thrown; it was treated as a miss.
	 */
	virtual void OnCacheError() noexcept {}

	virtual void OnProviderCall([[maybe_unused]] std::string_view provider_id,
				    [[maybe_unused]] std::chrono::milliseconds latency,
				    [[maybe_unused]] ProviderCallOutcome outcome) noexcept {}

	/**
	 * A request was rejected before reaching the coordinator.
	 *
	 * @param kind the error kind, e.g. "rate_limited"
	 */
	virtual void OnRejected([[maybe_unused]] std::string_view kind) noexcept {}
};
