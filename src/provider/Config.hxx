// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

enum class ProviderType : uint_least8_t {
	CLOUD,
	SELF_HOSTED,
	ON_DEVICE,
};

/**
 * Parse a provider type name.  Throws on error.
 */
ProviderType
ParseProviderType(const char *s);

struct ProviderConfig {
	std::string name;

	ProviderType type = ProviderType::SELF_HOSTED;

	/**
	 * The base URL of an HTTP backend.
	 */
	std::string url;

	std::string api_key;

	/**
	 * The phrase table of the on-device engine.
	 */
	std::string phrase_table;

	/**
	 * The maximum number of texts per backend request; 0 means the
	 * backend's default.
	 */
	unsigned max_units_per_call = 0;

	/**
	 * Overrides the global provider timeout; zero means unset.
	 */
	std::chrono::milliseconds timeout{};

	explicit ProviderConfig(std::string_view _name) noexcept
		:name(_name) {}

	/**
	 * Check whether the settings are complete.  Throws on error.
	 */
	void Check() const;
};
