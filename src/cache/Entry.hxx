// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

/**
 * A translation stored in the #TranslationCache.  Entries are never
 * modified; a newer result replaces the whole entry.
 */
struct CacheEntry {
	std::string text;
	std::string detected_source;

	std::chrono::steady_clock::time_point created, expires;

	/**
	 * The write sequence number which was allocated when the
	 * provider call producing this result was dispatched.
	 */
	uint64_t sequence = 0;

	bool IsExpired(std::chrono::steady_clock::time_point now) const noexcept {
		return now >= expires;
	}
};
