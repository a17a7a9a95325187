// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Cloud.hxx"
#include "Chunk.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "HttpGlue.hxx"
#include "curl/HttpClient.hxx"
#include "translation/Language.hxx"
#include "translation/Result.hxx"

#include <nlohmann/json.hpp>

#include <algorithm>

using std::string_view_literals::operator""sv;

static std::string
ToUpper(std::string_view s) noexcept
{
	std::string result{s};
	std::transform(result.begin(), result.end(), result.begin(),
		       [](unsigned char ch){
			       return ch >= 'a' && ch <= 'z' ? char(ch - 'a' + 'A') : char(ch);
		       });
	return result;
}

CloudProvider::CloudProvider(HttpClient &_client, const ProviderConfig &config)
	:id(config.name), client(_client),
	 base_url(config.url),
	 authorization("Authorization: DeepL-Auth-Key " + config.api_key),
	 max_texts(config.max_units_per_call > 0
		   ? std::min(config.max_units_per_call, MAX_TEXTS_PER_REQUEST)
		   : MAX_TEXTS_PER_REQUEST)
{
}

static nlohmann::json
MakeTranslateRequest(std::span<const TranslationUnit> units,
		     const BatchOptions &options)
{
	const auto &first = units.front();

	nlohmann::json texts = nlohmann::json::array();
	for (const auto &i : units)
		texts.push_back(i.text);

	nlohmann::json root{
		{"text", std::move(texts)},
		{"target_lang", ToUpper(first.target)},
	};

	if (!first.IsAutoSource())
		root.emplace("source_lang", ToUpper(first.source));

	if (first.format == TextFormat::HTML)
		root.emplace("tag_handling", "html");

	if (!options.glossary_id.empty())
		root.emplace("glossary_id", options.glossary_id);

	if (!options.formality.empty())
		root.emplace("formality", options.formality);

	if (options.preserve_entities)
		root.emplace("preserve_formatting", true);

	return root;
}

inline void
CloudProvider::TranslateChunk(std::span<const TranslationUnit> units,
			      const BatchOptions &options,
			      const CallContext &ctx,
			      std::vector<ProviderResult> &results)
{
	const auto start = std::chrono::steady_clock::now();

	HttpClientRequest request{
		.method = HttpMethod::POST,
		.uri = JoinUrl(base_url, "/v2/translate"sv),
		.headers = {authorization},
		.body = MakeTranslateRequest(units, options).dump(),
		.timeout = ctx.timeout,
		.cancel = ctx.cancel,
	};

	const auto root = RequestJson(client, id, request);

	const auto latency =
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	try {
		const auto &translations = root.at("translations"sv);
		if (!translations.is_array() || translations.size() != units.size())
			throw ProviderError(ProviderErrorKind::PERMANENT, id,
					    "Wrong number of translations in backend response");

		for (const auto &i : translations) {
			ProviderResult result{
				.text = i.at("text"sv).get<std::string>(),
				.detected_source = {},
				.provider_id = id,
				.latency = latency,
			};

			if (const auto d = i.find("detected_source_language"sv);
			    d != i.end() && d->is_string())
				result.detected_source = NormalizeLanguageCode(d->get<std::string_view>());

			results.emplace_back(std::move(result));
		}
	} catch (const nlohmann::json::exception &) {
		std::throw_with_nested(ProviderError(ProviderErrorKind::PERMANENT, id,
						     "Malformed backend response"));
	}
}

std::vector<ProviderResult>
CloudProvider::TranslateBatch(std::span<const TranslationUnit> units,
			      const BatchOptions &options,
			      const CallContext &ctx)
{
	std::vector<ProviderResult> results;
	results.reserve(units.size());

	ForEachChunk(units, max_texts, [&](std::span<const TranslationUnit> chunk){
		TranslateChunk(chunk, options, ctx, results);
	});

	return results;
}

DetectResult
CloudProvider::Detect(std::string_view text, const CallContext &ctx)
{
	/* this API has no detection call; translate the text and use
	   the detected source language */
	const TranslationUnit unit{
		.text = std::string{text},
		.source = std::string{AUTO_LANGUAGE},
		.target = "en-us",
		.format = TextFormat::TEXT,
	};

	auto results = TranslateBatch({&unit, 1}, {}, ctx);
	if (results.empty() || results.front().detected_source.empty())
		throw ProviderError(ProviderErrorKind::PERMANENT, id,
				    "Backend did not detect a language");

	return {std::move(results.front().detected_source), 1.0};
}

std::vector<LanguageInfo>
CloudProvider::ListLanguages(const CallContext &ctx)
{
	const HttpClientRequest request{
		.method = HttpMethod::GET,
		.uri = JoinUrl(base_url, "/v2/languages?type=target"sv),
		.headers = {authorization},
		.body = {},
		.content_type = {},
		.timeout = ctx.timeout,
		.cancel = ctx.cancel,
	};

	const auto root = RequestJson(client, id, request);

	std::vector<LanguageInfo> languages;

	try {
		if (!root.is_array())
			throw ProviderError(ProviderErrorKind::PERMANENT, id,
					    "Malformed language list");

		for (const auto &i : root) {
			LanguageInfo l;
			l.code = NormalizeLanguageCode(i.at("language"sv).get<std::string_view>());
			if (const auto name = i.find("name"sv);
			    name != i.end() && name->is_string())
				l.name = name->get<std::string>();
			languages.emplace_back(std::move(l));
		}
	} catch (const nlohmann::json::exception &) {
		std::throw_with_nested(ProviderError(ProviderErrorKind::PERMANENT, id,
						     "Malformed language list"));
	}

	return languages;
}
