// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

class CacheKey;
struct CacheEntry;

/**
 * The translation memory: maps a #CacheKey to a previously computed
 * translation.  Implementations are internally synchronized and may
 * be shared by all worker threads.
 *
 * Lookup() and Store() may throw; callers treat an exception as a
 * cache miss.
 */
class TranslationCache {
public:
	using Clock = std::chrono::steady_clock;

	virtual ~TranslationCache() noexcept = default;

	/**
	 * Allocate a new write sequence number.  Numbers are strictly
	 * increasing.
	 */
	virtual uint64_t NextSequence() noexcept = 0;

	/**
	 * @return a copy of the entry or std::nullopt if there is no
	 * valid entry for this key
	 */
	virtual std::optional<CacheEntry> Lookup(const CacheKey &key,
						 Clock::time_point now) = 0;

	/**
	 * Insert or replace an entry.  A live entry with a higher
	 * sequence number is never replaced.
	 *
	 * @return true if the entry was stored
	 */
	virtual bool Store(const CacheKey &key,
			   std::string_view text,
			   std::string_view detected_source,
			   Clock::duration ttl, uint64_t sequence,
			   Clock::time_point now) = 0;

	virtual void Evict(const CacheKey &key) noexcept = 0;
};
