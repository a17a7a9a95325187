// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BatchCoordinator.hxx"
#include "Error.hxx"
#include "MetricsHandler.hxx"
#include "cache/Entry.hxx"
#include "cache/Key.hxx"
#include "cache/TranslationCache.hxx"
#include "provider/Error.hxx"
#include "provider/Provider.hxx"
#include "translation/Context.hxx"
#include "translation/Error.hxx"
#include "translation/Unit.hxx"

#include <algorithm>
#include <cassert>
#include <optional>

using Clock = std::chrono::steady_clock;

void
BatchCoordinator::AddProvider(TranslationProvider &provider,
			      std::chrono::milliseconds timeout)
{
	providers.push_back({provider, timeout});
}

[[gnu::const]]
static ProviderCallOutcome
ToOutcome(ProviderErrorKind kind) noexcept
{
	return kind == ProviderErrorKind::TRANSIENT
		? ProviderCallOutcome::TRANSIENT_ERROR
		: ProviderCallOutcome::PERMANENT_ERROR;
}

template<typename F>
auto
BatchCoordinator::InvokeWithFallback(const RequestContext &ctx, F &&f)
{
	if (providers.empty())
		throw ProviderError(ProviderErrorKind::PERMANENT, {},
				    "No translation provider configured");

	const unsigned max_attempts = std::max(config.retry.max_attempts, 1U);

	std::exception_ptr last_error;

	for (const auto &slot : providers) {
		auto &provider = slot.provider;
		const auto timeout = slot.timeout.count() > 0
			? slot.timeout
			: config.provider_timeout;

		for (unsigned attempt = 1;; ++attempt) {
			ctx.Check();

			const auto start = Clock::now();
			const CallContext call_ctx{
				.timeout = ctx.Clip(timeout, start),
				.cancel = ctx.cancel,
			};

			try {
				auto result = f(provider, call_ctx);

				if (metrics != nullptr)
					metrics->OnProviderCall(provider.GetId(),
								std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start),
								ProviderCallOutcome::SUCCESS);

				return result;
			} catch (const ProviderError &e) {
				if (metrics != nullptr)
					metrics->OnProviderCall(provider.GetId(),
								std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start),
								ToOutcome(e.GetKind()));

				last_error = std::current_exception();

				if (!e.IsRetryable() || attempt >= max_attempts) {
					logger(2, "Provider '", provider.GetId(),
					       "' failed after ", attempt,
					       " attempt(s): ", e);
					break;
				}

				const auto delay = CalculateBackoff(config.retry, attempt);
				logger(3, "Provider '", provider.GetId(),
				       "' failed (", e, "), retrying in ",
				       delay.count(), " ms");
				ctx.Sleep(delay);
			}
		}
	}

	assert(last_error);
	std::rethrow_exception(last_error);
}

std::vector<ProviderResult>
BatchCoordinator::TranslateGroup(std::span<const TranslationUnit> units,
				 const BatchOptions &options,
				 const RequestContext &ctx)
{
	return InvokeWithFallback(ctx, [units, &options](TranslationProvider &provider,
							  const CallContext &call_ctx){
		auto results = provider.TranslateBatch(units, options, call_ctx);
		if (results.size() != units.size())
			throw ProviderError(ProviderErrorKind::PERMANENT,
					    provider.GetId(),
					    "Provider returned the wrong number of results");
		return results;
	});
}

namespace {

/**
 * A successful provider result which shall be written to the cache
 * after the request has completed.
 */
struct PendingStore {
	std::size_t index;
	uint64_t sequence;
};

}

static std::vector<TranslationResult>
Unwrap(std::vector<std::optional<TranslationResult>> &&results) noexcept
{
	std::vector<TranslationResult> v;
	v.reserve(results.size());
	for (auto &i : results) {
		assert(i);
		v.emplace_back(std::move(*i));
	}

	return v;
}

std::vector<TranslationResult>
BatchCoordinator::Translate(const BatchRequest &request,
			    const RequestContext &ctx)
{
	const auto &units = request.units;
	const std::size_t n = units.size();

	std::vector<std::optional<TranslationResult>> results(n);
	std::vector<UnitFailure> failures;

	/* keys[i] is only set for units which need a provider call */
	std::vector<std::optional<CacheKey>> keys(n);
	std::vector<std::size_t> misses;

	for (std::size_t i = 0; i < n; ++i) {
		const auto &unit = units[i];

		if (unit.IsSameLanguage()) {
			/* nothing to translate */
			results[i] = TranslationResult{unit.text, {}, false};
			continue;
		}

		const auto &key = keys[i].emplace(unit, request.options);

		if (cache != nullptr) {
			std::optional<CacheEntry> entry;

			try {
				entry = cache->Lookup(key, Clock::now());
			} catch (...) {
				logger(2, "Cache lookup failed: ", std::current_exception());
				if (metrics != nullptr)
					metrics->OnCacheError();
			}

			if (entry) {
				if (metrics != nullptr)
					metrics->OnCacheHit();

				results[i] = TranslationResult{
					std::move(entry->text),
					std::move(entry->detected_source),
					true,
				};
				continue;
			}

			if (metrics != nullptr)
				metrics->OnCacheMiss();
		}

		misses.push_back(i);
	}

	if (misses.empty())
		return Unwrap(std::move(results));

	const std::size_t group_size = config.max_units_per_call > 0
		? config.max_units_per_call
		: misses.size();

	std::vector<PendingStore> pending;
	std::vector<TranslationUnit> group;

	for (std::size_t g = 0; g < misses.size(); g += group_size) {
		const std::span<const std::size_t> indices{
			misses.data() + g,
			std::min(group_size, misses.size() - g),
		};

		group.clear();
		for (const std::size_t i : indices)
			group.push_back(units[i]);

		/* the sequence number is allocated at dispatch time, so a
		   slow call cannot overwrite a result which was requested
		   later */
		const uint64_t sequence = cache != nullptr
			? cache->NextSequence()
			: 0;

		try {
			auto group_results = TranslateGroup(group, request.options, ctx);

			for (std::size_t j = 0; j < indices.size(); ++j) {
				const std::size_t i = indices[j];
				const auto &unit = units[i];
				auto &r = group_results[j];

				if (!r.detected_source.empty() &&
				    r.detected_source == unit.target)
					/* already in the target language */
					r.text = unit.text;

				results[i] = TranslationResult{
					std::move(r.text),
					std::move(r.detected_source),
					false,
				};

				pending.push_back({i, sequence});
			}
		} catch (const ProviderError &e) {
			for (const std::size_t i : indices)
				failures.push_back({
					.index = i,
					.kind = e.GetKind(),
					.provider_id = e.GetProviderId(),
					.message = e.what(),
				});
		}
	}

	/* results of a cancelled or timed-out request must not be
	   cached */
	ctx.Check();

	if (cache != nullptr) {
		const auto now = Clock::now();

		for (const auto &p : pending) {
			const auto &r = *results[p.index];

			try {
				cache->Store(*keys[p.index], r.text, r.detected_source,
					     config.cache_ttl, p.sequence, now);
			} catch (...) {
				logger(2, "Cache store failed: ", std::current_exception());
				if (metrics != nullptr)
					metrics->OnCacheError();
			}
		}
	}

	if (failures.empty())
		return Unwrap(std::move(results));

	if (failures.size() == n)
		throw TotalFailure(std::move(results), std::move(failures));

	throw PartialFailure(std::move(results), std::move(failures));
}

DetectResult
BatchCoordinator::Detect(std::string_view text, const RequestContext &ctx)
{
	return InvokeWithFallback(ctx, [text](TranslationProvider &provider,
					       const CallContext &call_ctx){
		return provider.Detect(text, call_ctx);
	});
}

std::vector<LanguageInfo>
BatchCoordinator::ListLanguages(const RequestContext &ctx)
{
	const auto reported = InvokeWithFallback(ctx, [](TranslationProvider &provider,
							   const CallContext &call_ctx){
		return provider.ListLanguages(call_ctx);
	});

	return MergeLanguageCatalog(reported);
}
