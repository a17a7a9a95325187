// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "OnDevice.hxx"
#include "Config.hxx"
#include "Detect.hxx"
#include "Error.hxx"
#include "translation/Cancel.hxx"
#include "translation/Error.hxx"
#include "translation/Language.hxx"
#include "translation/Result.hxx"
#include "translation/Unit.hxx"

static PhraseTable
LoadPhraseTable(const ProviderConfig &config)
{
	PhraseTable table;
	table.Load(config.phrase_table);
	return table;
}

OnDeviceProvider::OnDeviceProvider(const ProviderConfig &config)
	:id(config.name), table(LoadPhraseTable(config))
{
}

inline ProviderResult
OnDeviceProvider::TranslateUnit(const TranslationUnit &unit) const
{
	ProviderResult result;
	result.provider_id = id;

	std::string source = unit.source;

	if (unit.IsAutoSource()) {
		if (auto d = DetectLanguage(unit.text))
			source = std::move(d->language);
		else if (const auto *s = table.FindSource(unit.target, unit.text))
			source = *s;
		else
			throw ProviderError(ProviderErrorKind::PERMANENT, id,
					    "Unable to detect the source language");

		result.detected_source = source;
	}

	if (source == unit.target) {
		result.text = unit.text;
		return result;
	}

	const std::string *translation = table.Find(source, unit.target, unit.text);
	if (translation == nullptr && unit.IsAutoSource()) {
		/* the detector may have been wrong; trust the table */
		if (const auto *s = table.FindSource(unit.target, unit.text)) {
			result.detected_source = *s;
			translation = table.Find(*s, unit.target, unit.text);
		}
	}

	if (translation == nullptr)
		throw ProviderError(ProviderErrorKind::PERMANENT, id,
				    "Unsupported phrase or language pair");

	result.text = *translation;
	return result;
}

std::vector<ProviderResult>
OnDeviceProvider::TranslateBatch(std::span<const TranslationUnit> units,
				 const BatchOptions &,
				 const CallContext &ctx)
{
	const auto start = std::chrono::steady_clock::now();

	std::vector<ProviderResult> results;
	results.reserve(units.size());

	for (const auto &unit : units) {
		if (ctx.cancel != nullptr && ctx.cancel->IsCancelled())
			throw RequestCancelled();

		results.emplace_back(TranslateUnit(unit));
	}

	const auto latency =
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	for (auto &i : results)
		i.latency = latency;

	return results;
}

DetectResult
OnDeviceProvider::Detect(std::string_view text, const CallContext &)
{
	auto result = DetectLanguage(text);
	if (!result)
		throw ProviderError(ProviderErrorKind::PERMANENT, id,
				    "Unable to detect the language");

	return std::move(*result);
}

std::vector<LanguageInfo>
OnDeviceProvider::ListLanguages(const CallContext &)
{
	std::vector<LanguageInfo> languages;
	for (const auto &code : table.GetLanguages()) {
		LanguageInfo l;
		l.code = code;
		languages.emplace_back(std::move(l));
	}

	return languages;
}
