// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"
#include "Logger.hxx"
#include "translation/Result.hxx"
#include "translation/Language.hxx"

#include <span>
#include <string_view>
#include <vector>

struct BatchRequest;
struct TranslationUnit;
struct BatchOptions;
struct RequestContext;
struct ProviderResult;
class TranslationCache;
class TranslationProvider;
class MetricsHandler;

/**
 * Runs a batch of translation units through the translation memory
 * and the providers.
 *
 * Cache misses are grouped, each group is sent to the providers in
 * the order in which they were added; transient errors are retried
 * with exponential backoff before the next provider is tried.
 * Successful results are stored in the cache only after the whole
 * request has completed without being cancelled.
 */
class BatchCoordinator {
	struct ProviderSlot {
		TranslationProvider &provider;

		/**
		 * Overrides CoordinatorConfig::provider_timeout if
		 * non-zero.
		 */
		std::chrono::milliseconds timeout;
	};

	const CoordinatorConfig config;

	/**
	 * May be nullptr if caching is disabled.
	 */
	TranslationCache *const cache;

	MetricsHandler *const metrics;

	std::vector<ProviderSlot> providers;

	const Logger logger{"coordinator"};

public:
	BatchCoordinator(const CoordinatorConfig &_config,
			 TranslationCache *_cache,
			 MetricsHandler *_metrics=nullptr) noexcept
		:config(_config), cache(_cache), metrics(_metrics) {}

	BatchCoordinator(const BatchCoordinator &) = delete;
	BatchCoordinator &operator=(const BatchCoordinator &) = delete;

	/**
	 * Append a provider to the fallback chain.  It must outlive
	 * this object.
	 */
	void AddProvider(TranslationProvider &provider,
			 std::chrono::milliseconds timeout={});

	bool HasProviders() const noexcept {
		return !providers.empty();
	}

	/**
	 * Translate all units of the request.
	 *
	 * Throws #PartialFailure or #TotalFailure if some or all units
	 * could not be translated, #RequestCancelled or
	 * #RequestTimeout if the request was abandoned.
	 *
	 * @return one result per unit, in the same order
	 */
	std::vector<TranslationResult> Translate(const BatchRequest &request,
						 const RequestContext &ctx);

	/**
	 * Detect the language of a text.  Throws #ProviderError if all
	 * providers have failed.
	 */
	DetectResult Detect(std::string_view text, const RequestContext &ctx);

	/**
	 * Obtain the language catalog of the first provider which
	 * answers, completed with the built-in catalog.  Throws
	 * #ProviderError if all providers have failed.
	 */
	std::vector<LanguageInfo> ListLanguages(const RequestContext &ctx);

private:
	/**
	 * Invoke the given function with each provider until one
	 * succeeds.  Transient errors are retried according to the
	 * #RetryPolicy.  Throws the last #ProviderError if all
	 * providers have failed.
	 */
	template<typename F>
	auto InvokeWithFallback(const RequestContext &ctx, F &&f);

	std::vector<ProviderResult> TranslateGroup(std::span<const TranslationUnit> units,
						   const BatchOptions &options,
						   const RequestContext &ctx);
};
