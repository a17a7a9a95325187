// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Provider.hxx"

class HttpClient;
struct ProviderConfig;

/**
 * A provider for a DeepL-style commercial REST API.
 */
class CloudProvider final : public TranslationProvider {
	const std::string id;

	HttpClient &client;

	const std::string base_url;

	/**
	 * The value of the "Authorization" request header.
	 */
	const std::string authorization;

	/**
	 * The maximum number of texts per request.
	 */
	const unsigned max_texts;

public:
	/**
	 * The backend accepts no more than this number of texts in
	 * one request.
	 */
	static constexpr unsigned MAX_TEXTS_PER_REQUEST = 50;

	CloudProvider(HttpClient &_client, const ProviderConfig &config);

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
			    const BatchOptions &options,
			    const CallContext &ctx,
			    std::vector<ProviderResult> &results);
};
