// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "coordinator/Config.hxx"
#include "front/Gateway.hxx"
#include "util/StringParser.hxx"

#include <lingo-gateway/Protocol.hxx>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <exception>
#include <iterator>
#include <stdexcept>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

/**
 * The names of all options accepted by GatewayConfig::HandleSet().
 */
static constexpr std::array option_names{
	"cache_ttl_seconds"sv,
	"cache_max_entries"sv,
	"rate_limit_window_ms"sv,
	"rate_limit_max_requests"sv,
	"provider_max_retries"sv,
	"provider_retry_base_delay_ms"sv,
	"provider_retry_max_delay_ms"sv,
	"provider_max_units_per_call"sv,
	"provider_timeout_ms"sv,
	"request_timeout_ms"sv,
	"auth_timeout_ms"sv,
	"max_batch_size"sv,
	"max_text_length"sv,
	"worker_threads"sv,
	"verbose_response"sv,
};

static std::chrono::milliseconds
ParsePositiveMilliseconds(const char *value)
{
	return std::chrono::milliseconds(ParsePositiveLong(value,
							   24L * 3600 * 1000));
}

void
GatewayConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "cache_ttl_seconds"sv) {
		cache_ttl = std::chrono::seconds(ParseUnsignedLong(value));
	} else if (name == "cache_max_entries"sv) {
		cache_max_entries = ParseUnsignedLong(value);
	} else if (name == "rate_limit_window_ms"sv) {
		rate_limit_window = ParsePositiveMilliseconds(value);
	} else if (name == "rate_limit_max_requests"sv) {
		rate_limit_max_requests = ParseUnsignedLong(value);
	} else if (name == "provider_max_retries"sv) {
		provider_max_retries = ParsePositiveLong(value, 100);
	} else if (name == "provider_retry_base_delay_ms"sv) {
		provider_retry_base_delay = ParsePositiveMilliseconds(value);
	} else if (name == "provider_retry_max_delay_ms"sv) {
		provider_retry_max_delay = ParsePositiveMilliseconds(value);
	} else if (name == "provider_max_units_per_call"sv) {
		provider_max_units_per_call = ParseUnsignedLong(value);
	} else if (name == "provider_timeout_ms"sv) {
		provider_timeout = ParsePositiveMilliseconds(value);
	} else if (name == "request_timeout_ms"sv) {
		request_timeout = ParsePositiveMilliseconds(value);
	} else if (name == "auth_timeout_ms"sv) {
		auth_timeout = ParsePositiveMilliseconds(value);
	} else if (name == "max_batch_size"sv) {
		max_batch_size = ParsePositiveLong(value, 65536);
	} else if (name == "max_text_length"sv) {
		max_text_length = ParsePositiveLong(value, 1024 * 1024);
	} else if (name == "worker_threads"sv) {
		worker_threads = ParsePositiveLong(value, 1024);
	} else if (name == "verbose_response"sv) {
		verbose_response = ParseBool(value);
	} else
		throw std::runtime_error("Unknown variable");
}

void
GatewayConfig::ApplyEnvironment()
{
	for (const auto name : option_names) {
		std::string variable{LingoGateway::ENV_PREFIX};
		std::transform(name.begin(), name.end(),
			       std::back_inserter(variable),
			       [](char ch){ return ch >= 'a' && ch <= 'z' ? ch - 'a' + 'A' : ch; });

		const char *value = getenv(variable.c_str());
		if (value == nullptr)
			continue;

		try {
			HandleSet(name, value);
		} catch (...) {
			std::throw_with_nested(std::runtime_error(fmt::format("Error in environment variable {}"sv,
									      variable)));
		}
	}
}

void
GatewayConfig::Finish()
{
	if (listeners.empty())
		listeners.emplace_back("*:8080");

	if (provider_retry_max_delay < provider_retry_base_delay)
		throw std::runtime_error("provider_retry_max_delay_ms is smaller than provider_retry_base_delay_ms");
}

CoordinatorConfig
GatewayConfig::GetCoordinatorConfig() const noexcept
{
	CoordinatorConfig c;
	c.cache_ttl = cache_ttl;
	c.max_units_per_call = provider_max_units_per_call;
	c.provider_timeout = provider_timeout;
	c.retry.max_attempts = provider_max_retries;
	c.retry.base_delay = provider_retry_base_delay;
	c.retry.max_delay = provider_retry_max_delay;
	return c;
}

GatewayOptions
GatewayConfig::GetGatewayOptions() const noexcept
{
	GatewayOptions o;
	o.limits.max_batch_size = max_batch_size;
	o.limits.max_text_length = max_text_length;
	o.request_timeout = request_timeout;
	o.verbose_response = verbose_response;
	return o;
}
