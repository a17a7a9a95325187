// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StubProvider.hxx"
#include "StubCache.hxx"
#include "MetricsHandler.hxx"
#include "cache/Memory.hxx"
#include "coordinator/BatchCoordinator.hxx"
#include "coordinator/Error.hxx"
#include "translation/Cancel.hxx"
#include "translation/Context.hxx"
#include "translation/Error.hxx"

#include <gtest/gtest.h>

#include <thread>

using namespace std::chrono_literals;

namespace {

struct RecordingMetrics final : MetricsHandler {
	unsigned hits = 0, misses = 0, errors = 0;
	unsigned successes = 0, transient = 0, permanent = 0;

	void OnCacheHit() noexcept override {
		++hits;
	}

	void OnCacheMiss() noexcept override {
		++misses;
	}

	void OnCacheError() noexcept override {
		++errors;
	}

	void OnProviderCall(std::string_view, std::chrono::milliseconds,
			    ProviderCallOutcome outcome) noexcept override {
		switch (outcome) {
		case ProviderCallOutcome::SUCCESS:
			++successes;
			break;

		case ProviderCallOutcome::TRANSIENT_ERROR:
			++transient;
			break;

		case ProviderCallOutcome::PERMANENT_ERROR:
			++permanent;
			break;
		}
	}
};

static CoordinatorConfig
MakeConfig(unsigned max_units_per_call=16)
{
	CoordinatorConfig config;
	config.cache_ttl = 3600s;
	config.max_units_per_call = max_units_per_call;
	config.provider_timeout = 1000ms;
	config.retry.max_attempts = 3;
	config.retry.base_delay = 1ms;
	config.retry.max_delay = 2ms;
	return config;
}

static BatchRequest
MakeRequest(std::initializer_list<const char *> texts,
	    const char *target="es", const char *source="en")
{
	BatchRequest request;
	for (const char *text : texts) {
		TranslationUnit unit;
		unit.text = text;
		unit.source = source;
		unit.target = target;
		request.units.push_back(std::move(unit));
	}

	return request;
}

}

TEST(BatchCoordinator, CacheHit)
{
	TranslationMemory memory(1024);
	RecordingMetrics metrics;
	StubProvider provider("stub");
	provider.AddPhrase("Hello", "es", "Hola");
	provider.AddPhrase("Goodbye", "es", "Adiós");

	BatchCoordinator coordinator(MakeConfig(), &memory, &metrics);
	coordinator.AddProvider(provider);

	const auto request = MakeRequest({"Hello", "Goodbye"});

	auto results = coordinator.Translate(request, RequestContext{});
	ASSERT_EQ(results.size(), 2U);
	EXPECT_EQ(results[0].text, "Hola");
	EXPECT_EQ(results[1].text, "Adiós");
	EXPECT_FALSE(results[0].cached);
	EXPECT_EQ(provider.n_calls, 1U);
	EXPECT_EQ(metrics.misses, 2U);
	EXPECT_EQ(memory.GetSize(), 2U);

	/* the second time, no provider is involved */
	results = coordinator.Translate(request, RequestContext{});
	ASSERT_EQ(results.size(), 2U);
	EXPECT_EQ(results[0].text, "Hola");
	EXPECT_EQ(results[1].text, "Adiós");
	EXPECT_TRUE(results[0].cached);
	EXPECT_TRUE(results[1].cached);
	EXPECT_EQ(provider.n_calls, 1U);
	EXPECT_EQ(metrics.hits, 2U);
}

TEST(BatchCoordinator, DetectedSourceCached)
{
	TranslationMemory memory(1024);
	StubProvider provider("stub");
	provider.AddPhrase("Hello", "es", "¡Hola!");
	provider.detected_source = "en";

	BatchCoordinator coordinator(MakeConfig(), &memory);
	coordinator.AddProvider(provider);

	const auto request = MakeRequest({"Hello"}, "es", "auto");

	auto results = coordinator.Translate(request, RequestContext{});
	ASSERT_EQ(results.size(), 1U);
	EXPECT_EQ(results[0].text, "¡Hola!");
	EXPECT_EQ(results[0].detected_source, "en");
	EXPECT_EQ(provider.n_calls, 1U);

	results = coordinator.Translate(request, RequestContext{});
	ASSERT_EQ(results.size(), 1U);
	EXPECT_EQ(results[0].text, "¡Hola!");
	EXPECT_EQ(results[0].detected_source, "en");
	EXPECT_EQ(provider.n_calls, 1U);
}

TEST(BatchCoordinator, Order)
{
	StubProvider provider("stub");
	BatchCoordinator coordinator(MakeConfig(2), nullptr);
	coordinator.AddProvider(provider);

	const auto request = MakeRequest({"a", "b", "c", "d", "e"}, "de");
	const auto results = coordinator.Translate(request, RequestContext{});

	ASSERT_EQ(results.size(), 5U);
	EXPECT_EQ(results[0].text, "[de] a");
	EXPECT_EQ(results[2].text, "[de] c");
	EXPECT_EQ(results[4].text, "[de] e");

	/* split into groups of two */
	EXPECT_EQ(provider.n_calls, 3U);
	EXPECT_EQ(provider.n_units, 5U);
}

TEST(BatchCoordinator, PartialFailure)
{
	TranslationMemory memory(1024);
	StubProvider provider("stub");
	provider.poison.emplace("B");

	BatchCoordinator coordinator(MakeConfig(1), &memory);
	coordinator.AddProvider(provider);

	try {
		coordinator.Translate(MakeRequest({"A", "B", "C"}),
				      RequestContext{});
		FAIL();
	} catch (const PartialFailure &e) {
		const auto &translations = e.GetTranslations();
		ASSERT_EQ(translations.size(), 3U);
		ASSERT_TRUE(translations[0]);
		EXPECT_EQ(translations[0]->text, "[es] A");
		EXPECT_FALSE(translations[1]);
		ASSERT_TRUE(translations[2]);
		EXPECT_EQ(translations[2]->text, "[es] C");

		const auto &failures = e.GetFailures();
		ASSERT_EQ(failures.size(), 1U);
		EXPECT_EQ(failures.front().index, 1U);
		EXPECT_EQ(failures.front().kind, ProviderErrorKind::PERMANENT);
		EXPECT_EQ(failures.front().provider_id, "stub");
		EXPECT_FALSE(e.IsRetryable());
	}

	/* the successful units have been cached */
	EXPECT_EQ(memory.GetSize(), 2U);
}

TEST(BatchCoordinator, PartialFailureGroups)
{
	StubProvider provider("stub");
	provider.poison.emplace("c");

	/* group 1 is units 0-1, group 2 is unit 2 */
	BatchCoordinator coordinator(MakeConfig(2), nullptr);
	coordinator.AddProvider(provider);

	try {
		coordinator.Translate(MakeRequest({"a", "b", "c"}),
				      RequestContext{});
		FAIL();
	} catch (const PartialFailure &e) {
		const auto &translations = e.GetTranslations();
		ASSERT_EQ(translations.size(), 3U);
		ASSERT_TRUE(translations[0]);
		EXPECT_EQ(translations[0]->text, "[es] a");
		ASSERT_TRUE(translations[1]);
		EXPECT_EQ(translations[1]->text, "[es] b");
		EXPECT_FALSE(translations[2]);

		ASSERT_EQ(e.GetFailures().size(), 1U);
		EXPECT_EQ(e.GetFailures().front().index, 2U);
	}

	EXPECT_EQ(provider.n_calls, 2U);
}

TEST(BatchCoordinator, TransientRetry)
{
	RecordingMetrics metrics;
	StubProvider provider("stub");
	provider.failures = {ProviderErrorKind::TRANSIENT,
			     ProviderErrorKind::TRANSIENT};

	BatchCoordinator coordinator(MakeConfig(), nullptr, &metrics);
	coordinator.AddProvider(provider);

	const auto results = coordinator.Translate(MakeRequest({"Hello"}),
						   RequestContext{});
	ASSERT_EQ(results.size(), 1U);
	EXPECT_EQ(results[0].text, "[es] Hello");
	EXPECT_EQ(provider.n_calls, 3U);
	EXPECT_EQ(metrics.transient, 2U);
	EXPECT_EQ(metrics.successes, 1U);
}

TEST(BatchCoordinator, TransientExhausted)
{
	StubProvider provider("stub");
	provider.failures = {ProviderErrorKind::TRANSIENT,
			     ProviderErrorKind::TRANSIENT,
			     ProviderErrorKind::TRANSIENT,
			     ProviderErrorKind::TRANSIENT};

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(provider);

	try {
		coordinator.Translate(MakeRequest({"Hello", "World"}),
				      RequestContext{});
		FAIL();
	} catch (const TotalFailure &e) {
		EXPECT_TRUE(e.IsRetryable());
		ASSERT_EQ(e.GetFailures().size(), 2U);
		EXPECT_EQ(e.GetFailures()[0].kind, ProviderErrorKind::TRANSIENT);
	}

	EXPECT_EQ(provider.n_calls, 3U);
}

TEST(BatchCoordinator, Permanent)
{
	RecordingMetrics metrics;
	StubProvider provider("stub");
	provider.failures = {ProviderErrorKind::PERMANENT};

	BatchCoordinator coordinator(MakeConfig(), nullptr, &metrics);
	coordinator.AddProvider(provider);

	try {
		coordinator.Translate(MakeRequest({"Hello"}), RequestContext{});
		FAIL();
	} catch (const TotalFailure &e) {
		EXPECT_FALSE(e.IsRetryable());
		ASSERT_EQ(e.GetTranslations().size(), 1U);
		EXPECT_FALSE(e.GetTranslations().front());
	}

	/* permanent errors are not retried */
	EXPECT_EQ(provider.n_calls, 1U);
	EXPECT_EQ(metrics.permanent, 1U);
}

TEST(BatchCoordinator, Fallback)
{
	StubProvider primary("primary"), secondary("secondary");
	primary.failures = {ProviderErrorKind::PERMANENT};
	secondary.AddPhrase("Hello", "es", "Hola");

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(primary);
	coordinator.AddProvider(secondary);

	const auto results = coordinator.Translate(MakeRequest({"Hello"}),
						   RequestContext{});
	ASSERT_EQ(results.size(), 1U);
	EXPECT_EQ(results[0].text, "Hola");
	EXPECT_EQ(primary.n_calls, 1U);
	EXPECT_EQ(secondary.n_calls, 1U);
}

TEST(BatchCoordinator, FallbackLastError)
{
	StubProvider primary("primary"), secondary("secondary");
	primary.failures = {ProviderErrorKind::PERMANENT};
	secondary.failures = {ProviderErrorKind::TRANSIENT,
			      ProviderErrorKind::TRANSIENT,
			      ProviderErrorKind::TRANSIENT};

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(primary);
	coordinator.AddProvider(secondary);

	try {
		coordinator.Translate(MakeRequest({"Hello"}), RequestContext{});
		FAIL();
	} catch (const TotalFailure &e) {
		ASSERT_EQ(e.GetFailures().size(), 1U);
		EXPECT_EQ(e.GetFailures().front().provider_id, "secondary");
		EXPECT_EQ(e.GetFailures().front().kind,
			  ProviderErrorKind::TRANSIENT);
	}
}

/**
 * A failing cache degrades to "no cache".
 */
TEST(BatchCoordinator, CacheError)
{
	FailingCache cache;
	RecordingMetrics metrics;
	StubProvider provider("stub");

	BatchCoordinator coordinator(MakeConfig(), &cache, &metrics);
	coordinator.AddProvider(provider);

	const auto results = coordinator.Translate(MakeRequest({"a", "b"}),
						   RequestContext{});
	ASSERT_EQ(results.size(), 2U);
	EXPECT_EQ(results[1].text, "[es] b");
	EXPECT_EQ(cache.n_lookups, 2U);
	EXPECT_EQ(cache.n_stores, 2U);
	EXPECT_EQ(metrics.errors, 4U);
}

TEST(BatchCoordinator, Cancelled)
{
	TranslationMemory memory(1024);
	StubProvider provider("stub");
	CancelFlag cancel;

	/* the client disconnects while the provider is working */
	provider.on_translate = [&cancel]{ cancel.Cancel(); };

	BatchCoordinator coordinator(MakeConfig(), &memory);
	coordinator.AddProvider(provider);

	EXPECT_THROW(coordinator.Translate(MakeRequest({"Hello"}),
					   RequestContext{RequestContext::Clock::time_point::max(),
							  &cancel}),
		     RequestCancelled);

	/* nothing was cached */
	EXPECT_EQ(memory.GetSize(), 0U);
}

TEST(BatchCoordinator, CancelledBeforeCall)
{
	StubProvider provider("stub");
	CancelFlag cancel;
	cancel.Cancel();

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(provider);

	EXPECT_THROW(coordinator.Translate(MakeRequest({"Hello"}),
					   RequestContext::WithTimeout(0ms, &cancel)),
		     RequestCancelled);
	EXPECT_EQ(provider.n_calls, 0U);
}

TEST(BatchCoordinator, Timeout)
{
	TranslationMemory memory(1024);
	StubProvider provider("stub");
	provider.on_translate = []{ std::this_thread::sleep_for(20ms); };

	BatchCoordinator coordinator(MakeConfig(), &memory);
	coordinator.AddProvider(provider);

	EXPECT_THROW(coordinator.Translate(MakeRequest({"Hello"}),
					   RequestContext::WithTimeout(5ms, nullptr)),
		     RequestTimeout);
	EXPECT_EQ(memory.GetSize(), 0U);
}

TEST(BatchCoordinator, SameLanguage)
{
	TranslationMemory memory(1024);
	StubProvider provider("stub");

	BatchCoordinator coordinator(MakeConfig(), &memory);
	coordinator.AddProvider(provider);

	const auto results = coordinator.Translate(MakeRequest({"Hallo"}, "de", "de"),
						   RequestContext{});
	ASSERT_EQ(results.size(), 1U);
	EXPECT_EQ(results[0].text, "Hallo");
	EXPECT_EQ(provider.n_calls, 0U);
	EXPECT_EQ(memory.GetSize(), 0U);
}

TEST(BatchCoordinator, DetectedTarget)
{
	StubProvider provider("stub");
	provider.detected_source = "es";

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(provider);

	const auto results = coordinator.Translate(MakeRequest({"Hola"}, "es", "auto"),
						   RequestContext{});
	ASSERT_EQ(results.size(), 1U);
	EXPECT_EQ(results[0].text, "Hola");
	EXPECT_EQ(results[0].detected_source, "es");
}

TEST(BatchCoordinator, Idempotent)
{
	StubProvider provider("stub");

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(provider);

	const auto request = MakeRequest({"one", "two", "three"}, "fr");
	const auto a = coordinator.Translate(request, RequestContext{});
	const auto b = coordinator.Translate(request, RequestContext{});

	ASSERT_EQ(a.size(), b.size());
	for (std::size_t i = 0; i < a.size(); ++i)
		EXPECT_EQ(a[i].text, b[i].text);
}

TEST(BatchCoordinator, Detect)
{
	StubProvider primary("primary"), secondary("secondary");
	primary.failures = {ProviderErrorKind::PERMANENT};
	secondary.detect_result = {"fr", 0.75};

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(primary);
	coordinator.AddProvider(secondary);

	const auto result = coordinator.Detect("Bonjour", RequestContext{});
	EXPECT_EQ(result.language, "fr");
	EXPECT_DOUBLE_EQ(result.confidence, 0.75);
}

TEST(BatchCoordinator, ListLanguages)
{
	StubProvider provider("stub");
	provider.languages = {
		{.code = "fr"},
		{.code = "ar"},
		{.code = "xx"},
		{.code = "fr"},
	};

	BatchCoordinator coordinator(MakeConfig(), nullptr);
	coordinator.AddProvider(provider);

	const auto languages = coordinator.ListLanguages(RequestContext{});
	ASSERT_EQ(languages.size(), 3U);
	EXPECT_EQ(languages[0].code, "ar");
	EXPECT_EQ(languages[0].direction, TextDirection::RTL);
	EXPECT_EQ(languages[1].code, "fr");
	EXPECT_EQ(languages[1].name, "French");
	EXPECT_EQ(languages[2].code, "xx");
	EXPECT_EQ(languages[2].name, "xx");
}

TEST(BatchCoordinator, NoProviders)
{
	BatchCoordinator coordinator(MakeConfig(), nullptr);
	EXPECT_FALSE(coordinator.HasProviders());

	EXPECT_THROW(coordinator.Translate(MakeRequest({"Hello"}),
					   RequestContext{}),
		     TotalFailure);
	EXPECT_THROW(coordinator.Detect("Hello", RequestContext{}),
		     ProviderError);
}
