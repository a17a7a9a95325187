// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "provider/Config.hxx"
#include "front/Speech.hxx"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

struct CoordinatorConfig;
struct GatewayOptions;

/**
 * Configuration.
 */
struct GatewayConfig {
	/**
	 * Listener addresses in the form "HOST:PORT".
	 */
	std::vector<std::string> listeners;

	/**
	 * The providers in fallback order.
	 */
	std::vector<ProviderConfig> providers;

	/**
	 * The path of the credential file.
	 */
	std::string credentials_path;

	SpeechConfig speech;

	std::chrono::seconds cache_ttl{3600};

	/**
	 * The maximum number of translation memory entries; 0 disables
	 * the translation memory.
	 */
	std::size_t cache_max_entries = 65536;

	std::chrono::milliseconds rate_limit_window{60000};

	/**
	 * 0 disables rate limiting.
	 */
	unsigned rate_limit_max_requests = 60;

	unsigned provider_max_retries = 3;
	std::chrono::milliseconds provider_retry_base_delay{100};
	std::chrono::milliseconds provider_retry_max_delay{2000};
	unsigned provider_max_units_per_call = 16;
	std::chrono::milliseconds provider_timeout{10000};

	std::chrono::milliseconds request_timeout{30000};
	std::chrono::milliseconds auth_timeout{1000};

	std::size_t max_batch_size = 128;
	std::size_t max_text_length = 10000;

	unsigned worker_threads = 8;

	bool verbose_response = false;

	/**
	 * Handle a "set" line from the configuration file, an
	 * environment variable or a "--set" option.  Throws on error.
	 */
	void HandleSet(std::string_view name, const char *value);

	/**
	 * Apply the LINGO_GATEWAY_* environment variables.  Throws on
	 * error.
	 */
	void ApplyEnvironment();

	/**
	 * Apply defaults and check the configuration.  Throws on error.
	 */
	void Finish();

	[[gnu::pure]]
	CoordinatorConfig GetCoordinatorConfig() const noexcept;

	[[gnu::pure]]
	GatewayOptions GetGatewayOptions() const noexcept;
};

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 */
void
LoadConfigFile(GatewayConfig &config, const char *path);
