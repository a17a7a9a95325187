// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "Config.hxx"
#include "auth/Authenticator.hxx"
#include "cache/Memory.hxx"
#include "coordinator/BatchCoordinator.hxx"
#include "front/Gateway.hxx"
#include "front/HttpFront.hxx"
#include "front/Speech.hxx"
#include "limit/RateLimiter.hxx"
#include "provider/Factory.hxx"
#include "provider/Provider.hxx"
#include "thread/Pool.hxx"

#include <fmt/format.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

static constexpr auto CLEANUP_INTERVAL = std::chrono::seconds(60);

/**
 * Client connections which are idle for this long are closed.
 */
static constexpr auto HTTP_CONNECTION_TIMEOUT = std::chrono::seconds(60);

/**
 * Add some headroom for JSON syntax and escaping to the configured
 * text limits.
 */
[[gnu::const]]
static std::size_t
CalculateMaxBodySize(const GatewayConfig &config) noexcept
{
	return config.max_batch_size * (config.max_text_length * 2 + 16) + 4096;
}

Instance::Instance()
	:shutdown_listener(event_loop, [this]{ ShutdownCallback(); }),
	 cleanup_timer(event_loop, CLEANUP_INTERVAL,
		       [this]{ return OnCleanupTimer(); }),
	 http_client("lingo-gateway/" LINGO_GATEWAY_VERSION)
{
}

Instance::~Instance() noexcept
{
	StopWorkers();

	/* evhttp_free() before the objects it refers to */
	front.reset();
	thread_pool.reset();
}

void
Instance::Setup(const GatewayConfig &config)
{
	if (Logger::IsLevelVisible(5))
		http_client.EnableVerbose();

	if (!config.credentials_path.empty()) {
		credentials.Load(config.credentials_path);
		logger(3, "Loaded ", credentials.size(), " credentials");
	} else
		logger(2, "No credentials configured; all requests will be rejected");

	if (config.cache_max_entries > 0)
		memory = std::make_unique<TranslationMemory>(config.cache_max_entries);

	coordinator = std::make_unique<BatchCoordinator>(config.GetCoordinatorConfig(),
							 memory.get(), &stats);

	for (const auto &i : config.providers) {
		try {
			providers.emplace_back(CreateProvider(i, http_client));
		} catch (...) {
			std::throw_with_nested(std::runtime_error(fmt::format("Failed to set up provider '{}'"sv,
									      i.name)));
		}

		coordinator->AddProvider(*providers.back(), i.timeout);
	}

	if (!coordinator->HasProviders())
		logger(2, "No providers configured");

	limiter = std::make_unique<RateLimiter>(config.rate_limit_window,
						config.rate_limit_max_requests);

	authenticator = std::make_unique<Authenticator>(credentials,
							config.auth_timeout,
							&audit_handler);

	if (!config.speech.tts_url.empty() || !config.speech.stt_url.empty())
		speech = std::make_unique<SpeechDelegate>(config.speech,
							  http_client);

	gateway = std::make_unique<Gateway>(config.GetGatewayOptions(),
					    *authenticator, *limiter,
					    *coordinator, speech.get(),
					    &stats);

	thread_pool = std::make_unique<ThreadPool>(event_loop,
						   config.worker_threads);
	thread_pool->Start();

	front = std::make_unique<HttpFront>(event_loop,
					    thread_pool->GetQueue(),
					    *gateway, stats,
					    CalculateMaxBodySize(config),
					    HTTP_CONNECTION_TIMEOUT);

	for (const auto &i : config.listeners)
		front->Bind(i.c_str());

	shutdown_listener.Enable();
	cleanup_timer.Enable();
}

void
Instance::Run() noexcept
{
	event_loop.Dispatch();

	stats.Log(logger);
}

void
Instance::StopWorkers() noexcept
{
	if (front)
		front->CancelAll();

	if (thread_pool)
		thread_pool->StopAndJoin();
}

void
Instance::ShutdownCallback() noexcept
{
	should_exit = true;

	cleanup_timer.Disable();

	StopWorkers();

	event_loop.Break();
}

bool
Instance::OnCleanupTimer() noexcept
{
	const auto now = std::chrono::steady_clock::now();

	std::size_t n_cache = 0;
	if (memory)
		n_cache = memory->Expire(now);

	const std::size_t n_windows = limiter ? limiter->Expire(now) : 0;

	logger(4, "Cleanup: removed ", n_cache, " cache entries and ",
	       n_windows, " rate limit windows");

	return true;
}
