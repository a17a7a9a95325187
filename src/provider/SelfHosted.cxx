// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SelfHosted.hxx"
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

SelfHostedProvider::SelfHostedProvider(HttpClient &_client,
				       const ProviderConfig &config)
	:id(config.name), client(_client),
	 base_url(config.url), api_key(config.api_key),
	 max_texts(config.max_units_per_call)
{
}

inline void
SelfHostedProvider::TranslateChunk(std::span<const TranslationUnit> units,
				   const CallContext &ctx,
				   std::vector<ProviderResult> &results)
{
	const auto &first = units.front();

	nlohmann::json q = nlohmann::json::array();
	for (const auto &i : units)
		q.push_back(i.text);

	nlohmann::json body{
		{"q", std::move(q)},
		{"source", first.source},
		{"target", first.target},
		{"format", ToString(first.format)},
	};

	if (!api_key.empty())
		body.emplace("api_key", api_key);

	const auto start = std::chrono::steady_clock::now();

	const HttpClientRequest request{
		.method = HttpMethod::POST,
		.uri = JoinUrl(base_url, "/translate"sv),
		.headers = {},
		.body = body.dump(),
		.timeout = ctx.timeout,
		.cancel = ctx.cancel,
	};

	const auto root = RequestJson(client, id, request);

	const auto latency =
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

	try {
		const auto &translated = root.at("translatedText"sv);
		if (!translated.is_array() || translated.size() != units.size())
			throw ProviderError(ProviderErrorKind::PERMANENT, id,
					    "Wrong number of translations in backend response");

		const nlohmann::json *detected = nullptr;
		if (const auto d = root.find("detectedLanguage"sv);
		    d != root.end() && d->is_array() && d->size() == units.size())
			detected = &*d;

		for (std::size_t i = 0; i < units.size(); ++i) {
			ProviderResult result{
				.text = translated[i].get<std::string>(),
				.detected_source = {},
				.provider_id = id,
				.latency = latency,
			};

			if (detected != nullptr) {
				const auto &d = (*detected)[i];
				if (const auto l = d.find("language"sv);
				    l != d.end() && l->is_string())
					result.detected_source = NormalizeLanguageCode(l->get<std::string_view>());
			}

			results.emplace_back(std::move(result));
		}
	} catch (const nlohmann::json::exception &) {
		std::throw_with_nested(ProviderError(ProviderErrorKind::PERMANENT, id,
						     "Malformed backend response"));
	}
}

std::vector<ProviderResult>
SelfHostedProvider::TranslateBatch(std::span<const TranslationUnit> units,
				   const BatchOptions &options,
				   const CallContext &ctx)
{
	if (!options.glossary_id.empty())
		/* let the next provider handle it */
		throw ProviderError(ProviderErrorKind::PERMANENT, id,
				    "Glossaries are not supported");

	std::vector<ProviderResult> results;
	results.reserve(units.size());

	ForEachChunk(units, max_texts, [&](std::span<const TranslationUnit> chunk){
		TranslateChunk(chunk, ctx, results);
	});

	return results;
}

DetectResult
SelfHostedProvider::Detect(std::string_view text, const CallContext &ctx)
{
	nlohmann::json body{
		{"q", text},
	};

	if (!api_key.empty())
		body.emplace("api_key", api_key);

	const HttpClientRequest request{
		.method = HttpMethod::POST,
		.uri = JoinUrl(base_url, "/detect"sv),
		.headers = {},
		.body = body.dump(),
		.timeout = ctx.timeout,
		.cancel = ctx.cancel,
	};

	const auto root = RequestJson(client, id, request);

	try {
		if (!root.is_array() || root.empty())
			throw ProviderError(ProviderErrorKind::PERMANENT, id,
					    "Backend did not detect a language");

		/* the candidates are sorted by confidence; the backend
		   reports percent, sometimes out of range */
		const auto &best = root.front();
		return {
			NormalizeLanguageCode(best.at("language"sv).get<std::string_view>()),
			std::clamp(best.at("confidence"sv).get<double>() / 100., 0., 1.),
		};
	} catch (const nlohmann::json::exception &) {
		std::throw_with_nested(ProviderError(ProviderErrorKind::PERMANENT, id,
						     "Malformed backend response"));
	}
}

std::vector<LanguageInfo>
SelfHostedProvider::ListLanguages(const CallContext &ctx)
{
	const HttpClientRequest request{
		.method = HttpMethod::GET,
		.uri = JoinUrl(base_url, "/languages"sv),
		.headers = {},
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
			l.code = NormalizeLanguageCode(i.at("code"sv).get<std::string_view>());
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
