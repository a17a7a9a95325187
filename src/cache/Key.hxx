// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

struct TranslationUnit;
struct BatchOptions;

/**
 * The fingerprint of a translation request: an unambiguous
 * serialization of all fields which influence the result.  Each
 * field is prefixed with its length, so two different field tuples
 * can never produce the same key.  No normalization is applied:
 * keys are case- and whitespace-sensitive.
 */
class CacheKey {
	std::string value;
	std::size_t hash;

public:
	CacheKey(const TranslationUnit &unit, const BatchOptions &options);

	std::string_view GetValue() const noexcept {
		return value;
	}

	std::size_t GetHash() const noexcept {
		return hash;
	}

	friend bool operator==(const CacheKey &a, const CacheKey &b) noexcept {
		return a.hash == b.hash && a.value == b.value;
	}

	struct Hash {
		[[gnu::pure]]
		std::size_t operator()(const CacheKey &key) const noexcept {
			return key.GetHash();
		}
	};
};
