// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>

/**
 * The result of translating one unit, as reported by a provider.
 */
struct ProviderResult {
	std::string text;

	/**
	 * The source language detected by the provider; empty if the
	 * provider did not report one.
	 */
	std::string detected_source;

	std::string provider_id;

	std::chrono::milliseconds latency{};
};

/**
 * One element of a batch response.
 */
struct TranslationResult {
	std::string text;
	std::string detected_source;

	/**
	 * Was this result served from the translation memory?
	 */
	bool cached = false;
};

struct DetectResult {
	std::string language;
	double confidence = 0;
};
