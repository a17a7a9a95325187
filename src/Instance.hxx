// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Logger.hxx"
#include "Stats.hxx"
#include "auth/Audit.hxx"
#include "auth/FileCredentialStore.hxx"
#include "curl/HttpClient.hxx"
#include "event/Loop.hxx"
#include "event/ShutdownListener.hxx"
#include "event/CleanupTimer.hxx"

#include <memory>
#include <vector>

struct GatewayConfig;
class TranslationMemory;
class TranslationProvider;
class RateLimiter;
class Authenticator;
class BatchCoordinator;
class SpeechDelegate;
class Gateway;
class ThreadPool;
class HttpFront;

/**
 * The process-wide state of the gateway.
 */
struct Instance {
	const Logger logger{"main"};

	EventLoop event_loop;

	bool should_exit = false;

	ShutdownListener shutdown_listener;

	/**
	 * Periodically removes expired translation memory entries and
	 * idle rate limiter windows.
	 */
	CleanupTimer cleanup_timer;

	Stats stats;

	LoggingAuditHandler audit_handler;

	HttpClient http_client;

	FileCredentialStore credentials;

	/**
	 * nullptr if the translation memory is disabled.
	 */
	std::unique_ptr<TranslationMemory> memory;

	std::vector<std::unique_ptr<TranslationProvider>> providers;

	std::unique_ptr<RateLimiter> limiter;
	std::unique_ptr<Authenticator> authenticator;
	std::unique_ptr<BatchCoordinator> coordinator;

	/**
	 * nullptr if no speech backend is configured.
	 */
	std::unique_ptr<SpeechDelegate> speech;

	std::unique_ptr<Gateway> gateway;

	std::unique_ptr<ThreadPool> thread_pool;
	std::unique_ptr<HttpFront> front;

	Instance();
	~Instance() noexcept;

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;

	/**
	 * Create all services according to the configuration and start
	 * listening.  Throws on error.
	 */
	void Setup(const GatewayConfig &config);

	void Run() noexcept;

private:
	void ShutdownCallback() noexcept;

	bool OnCleanupTimer() noexcept;

	/**
	 * Cancel all pending requests and stop the worker threads.
	 */
	void StopWorkers() noexcept;
};
