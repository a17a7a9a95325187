// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TempFile.hxx"
#include "Config.hxx"
#include "coordinator/Config.hxx"
#include "front/Gateway.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdlib.h>

using namespace std::chrono_literals;

TEST(Config, Defaults)
{
	GatewayConfig config;
	config.Finish();

	ASSERT_EQ(config.listeners.size(), 1U);
	EXPECT_EQ(config.listeners.front(), "*:8080");
	EXPECT_TRUE(config.providers.empty());

	const auto c = config.GetCoordinatorConfig();
	EXPECT_EQ(c.cache_ttl, 3600s);
	EXPECT_EQ(c.max_units_per_call, 16U);
	EXPECT_EQ(c.retry.max_attempts, 3U);
	EXPECT_EQ(c.retry.base_delay, 100ms);
	EXPECT_EQ(c.retry.max_delay, 2000ms);

	const auto o = config.GetGatewayOptions();
	EXPECT_EQ(o.limits.max_batch_size, 128U);
	EXPECT_EQ(o.limits.max_text_length, 10000U);
	EXPECT_EQ(o.request_timeout, 30000ms);
	EXPECT_FALSE(o.verbose_response);
}

TEST(Config, HandleSet)
{
	GatewayConfig config;
	config.HandleSet("cache_ttl_seconds", "60");
	config.HandleSet("rate_limit_max_requests", "0");
	config.HandleSet("provider_retry_base_delay_ms", "10");
	config.HandleSet("verbose_response", "yes");
	config.HandleSet("worker_threads", "2");

	EXPECT_EQ(config.cache_ttl, 60s);
	EXPECT_EQ(config.rate_limit_max_requests, 0U);
	EXPECT_EQ(config.provider_retry_base_delay, 10ms);
	EXPECT_TRUE(config.verbose_response);
	EXPECT_EQ(config.worker_threads, 2U);

	EXPECT_THROW(config.HandleSet("no_such_option", "1"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("worker_threads", "0"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("worker_threads", "many"), std::runtime_error);
	EXPECT_THROW(config.HandleSet("verbose_response", "maybe"), std::runtime_error);
}

TEST(Config, RetryDelays)
{
	GatewayConfig config;
	config.HandleSet("provider_retry_base_delay_ms", "500");
	config.HandleSet("provider_retry_max_delay_ms", "100");
	EXPECT_THROW(config.Finish(), std::runtime_error);
}

TEST(Config, Environment)
{
	setenv("LINGO_GATEWAY_MAX_BATCH_SIZE", "7", 1);
	setenv("LINGO_GATEWAY_PROVIDER_TIMEOUT_MS", "1234", 1);

	GatewayConfig config;
	config.ApplyEnvironment();
	EXPECT_EQ(config.max_batch_size, 7U);
	EXPECT_EQ(config.provider_timeout, 1234ms);

	setenv("LINGO_GATEWAY_MAX_BATCH_SIZE", "-1", 1);

	try {
		config.ApplyEnvironment();
		FAIL();
	} catch (...) {
		EXPECT_NE(GetFullMessage(std::current_exception()).find("LINGO_GATEWAY_MAX_BATCH_SIZE"),
			  std::string::npos);
	}

	unsetenv("LINGO_GATEWAY_MAX_BATCH_SIZE");
	unsetenv("LINGO_GATEWAY_PROVIDER_TIMEOUT_MS");
}

TEST(Config, File)
{
	const TempFile file{R"(
# a comment
@set backend = "http://mt.example.com"

listener {
  bind "127.0.0.1:8081"
}

listener {
  bind "[::1]:8082"
}

provider "primary" {
  type "self_hosted"
  url "${backend}/v1"
  max_units_per_call 8
}

provider "cloud" {
  type "cloud"
  url "https://cloud.example.com"
  api_key "s3cret"
  timeout_ms 5000
}

speech {
  tts_url "http://tts.example.com/synthesize"
}

credentials "/etc/lingo-gateway/keys"

set cache_max_entries = "1000"
set request_timeout_ms = "15000"
)"};

	GatewayConfig config;
	LoadConfigFile(config, file.c_str());
	config.Finish();

	ASSERT_EQ(config.listeners.size(), 2U);
	EXPECT_EQ(config.listeners[0], "127.0.0.1:8081");
	EXPECT_EQ(config.listeners[1], "[::1]:8082");

	ASSERT_EQ(config.providers.size(), 2U);
	EXPECT_EQ(config.providers[0].name, "primary");
	EXPECT_EQ(config.providers[0].type, ProviderType::SELF_HOSTED);
	EXPECT_EQ(config.providers[0].url, "http://mt.example.com/v1");
	EXPECT_EQ(config.providers[0].max_units_per_call, 8U);
	EXPECT_EQ(config.providers[1].name, "cloud");
	EXPECT_EQ(config.providers[1].type, ProviderType::CLOUD);
	EXPECT_EQ(config.providers[1].api_key, "s3cret");
	EXPECT_EQ(config.providers[1].timeout, 5000ms);

	EXPECT_EQ(config.speech.tts_url, "http://tts.example.com/synthesize");
	EXPECT_TRUE(config.speech.stt_url.empty());

	EXPECT_EQ(config.credentials_path, "/etc/lingo-gateway/keys");
	EXPECT_EQ(config.cache_max_entries, 1000U);
	EXPECT_EQ(config.request_timeout, 15000ms);
}

static std::string
LoadError(const char *contents)
{
	const TempFile file{contents};

	try {
		GatewayConfig config;
		LoadConfigFile(config, file.c_str());
	} catch (...) {
		return GetFullMessage(std::current_exception());
	}

	return {};
}

TEST(Config, FileErrors)
{
	auto msg = LoadError("frobnicate\n");
	EXPECT_NE(msg.find("Unknown option"), msg.npos);
	EXPECT_NE(msg.find(":1"), msg.npos);

	msg = LoadError("provider \"a\" {\n  type \"cloud\"\n  url \"http://x\"\n}\n");
	EXPECT_NE(msg.find("api_key"), msg.npos);

	msg = LoadError("provider \"a\" {\n  type \"on_device\"\n  phrase_table \"/p\"\n}\n"
			"provider \"a\" {\n  type \"on_device\"\n  phrase_table \"/p\"\n}\n");
	EXPECT_NE(msg.find("Duplicate"), msg.npos);

	msg = LoadError("provider \"a\" {\n  type \"carrier_pigeon\"\n}\n");
	EXPECT_NE(msg.find("Unknown provider type"), msg.npos);

	msg = LoadError("listener {\n}\n");
	EXPECT_NE(msg.find("no bind address"), msg.npos);

	msg = LoadError("set worker_threads = \"0\"\n");
	EXPECT_FALSE(msg.empty());
}

TEST(Config, Include)
{
	const TempFile included{R"(
provider "local" {
  type "on_device"
  phrase_table "${dir}/phrases.tsv"
}
)"};

	const std::string main_contents =
		"@set dir = \"/var/lib/lingo\"\n"
		"@include \"" + included.GetPath().filename().native() + "\"\n"
		"set max_batch_size = ${size}\n";

	/* "size" is not defined */
	auto msg = LoadError(main_contents.c_str());
	EXPECT_NE(msg.find("No such variable: size"), msg.npos);
	EXPECT_NE(msg.find(":3"), msg.npos);

	const TempFile file{"@set size = \"64\"\n" + main_contents};

	GatewayConfig config;
	LoadConfigFile(config, file.c_str());

	ASSERT_EQ(config.providers.size(), 1U);
	EXPECT_EQ(config.providers.front().name, "local");
	EXPECT_EQ(config.providers.front().phrase_table,
		  "/var/lib/lingo/phrases.tsv");
	EXPECT_EQ(config.max_batch_size, 64U);
}

TEST(Config, Quoting)
{
	const TempFile file{R"(
@set key = "a \"quoted\" key"
speech {
  tts_url 'http://tts/${literal}'
  api_key "${key}"
  stt_url "http://stt/\\path"
}
)"};

	GatewayConfig config;
	LoadConfigFile(config, file.c_str());

	/* no expansion in single quotes */
	EXPECT_EQ(config.speech.tts_url, "http://tts/${literal}");
	EXPECT_EQ(config.speech.api_key, "a \"quoted\" key");
	EXPECT_EQ(config.speech.stt_url, "http://stt/\\path");
}

TEST(Config, SyntaxErrors)
{
	auto msg = LoadError("listener {\n  bind \"*:80\"\n");
	EXPECT_NE(msg.find("Block not closed"), msg.npos);

	msg = LoadError("listener { bind \"*:80\" }\n");
	EXPECT_NE(msg.find("Unexpected tokens"), msg.npos);

	msg = LoadError("credentials \"/etc/keys\n");
	EXPECT_NE(msg.find("Missing closing"), msg.npos);

	msg = LoadError("provider \"a\" {\n  max_units_per_call 0\n}\n");
	EXPECT_NE(msg.find("Positive integer expected"), msg.npos);
	EXPECT_NE(msg.find(":2"), msg.npos);

	msg = LoadError("@include \"/nonexistent/lingo-gateway.conf\"\n");
	EXPECT_NE(msg.find("Failed to open /nonexistent/lingo-gateway.conf"),
		  msg.npos);
}
