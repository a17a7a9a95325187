// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Provider.hxx"

class HttpClient;
struct ProviderConfig;

/**
 * A provider for a LibreTranslate-style self-hosted server.
 */
class SelfHostedProvider final : public TranslationProvider {
	const std::string id;

	HttpClient &client;

	const std::string base_url;

	/**
	 * Optional; empty if the server does not require a key.
	 */
	const std::string api_key;

	/**
	 * The maximum number of texts per request; 0 means no limit.
	 */
	const unsigned max_texts;

public:
	SelfHostedProvider(HttpClient &_client, const ProviderConfig &config);

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
	void TranslateChunk(std::span<const TranslationUnit> units,
			    const CallContext &ctx,
			    std::vector<ProviderResult> &results);
};
