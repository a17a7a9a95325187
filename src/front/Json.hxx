// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

struct BatchRequest;
struct TranslationResult;
struct DetectResult;
struct LanguageInfo;
struct UnitFailure;

struct RequestLimits {
	/**
	 * The maximum number of texts in one translate request.
	 */
	std::size_t max_batch_size = 128;

	/**
	 * The maximum length of one text in bytes.
	 */
	std::size_t max_text_length = 10000;
};

/**
 * Parse the body of a translate request.  Throws #ValidationError.
 */
BatchRequest
ParseTranslateRequest(std::string_view body, const RequestLimits &limits);

/**
 * Parse the body of a detect request.  Throws #ValidationError.
 *
 * @return the text
 */
std::string
ParseDetectRequest(std::string_view body, const RequestLimits &limits);

void
to_json(nlohmann::json &j, const TranslationResult &result);

void
to_json(nlohmann::json &j, const DetectResult &result);

void
to_json(nlohmann::json &j, const LanguageInfo &language);

void
to_json(nlohmann::json &j, const UnitFailure &failure);

/**
 * Serialize a JSON document for a response body.  Invalid UTF-8
 * in strings (e.g. from a provider) is replaced with U+FFFD instead
 * of throwing.
 */
std::string
DumpJson(const nlohmann::json &j);

std::string
FormatTranslateResponse(std::span<const TranslationResult> translations);
