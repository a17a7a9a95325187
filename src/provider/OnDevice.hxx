// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Provider.hxx"
#include "PhraseTable.hxx"

struct ProviderConfig;

/**
 * An in-process engine which needs no network: translations are
 * looked up in a #PhraseTable, languages are detected with
 * DetectLanguage().  Phrases which are not in the table cannot be
 * translated; this is a permanent error.
 */
class OnDeviceProvider final : public TranslationProvider {
	const std::string id;

	const PhraseTable table;

public:
	OnDeviceProvider(std::string_view _id, PhraseTable &&_table) noexcept
		:id(_id), table(std::move(_table)) {}

	/**
	 * Load the phrase table.  Throws on error.
	 */
	explicit OnDeviceProvider(const ProviderConfig &config);

	/* virtual methods from class TranslationProvider */
	const std::string &GetId() const noexcept override {
		return id;
	}

	std::vector<ProviderResult> TranslateBatch(std::span<const TranslationUnit> units,
						   const BatchOptions &options,
						   const CallContext &ctx) override;
	DetectResult Detect(std::string_view text,
			    const CallContext &ctx) override;
	std::vector<LanguageInfo> ListLanguages(const CallContext &ctx) override;

private:
	ProviderResult TranslateUnit(const TranslationUnit &unit) const;
};
