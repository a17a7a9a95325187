// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * The pseudo language code which asks the provider to detect the
 * source language.
 */
inline constexpr std::string_view AUTO_LANGUAGE = "auto";

enum class TextFormat : uint_least8_t {
	TEXT,
	HTML,
};

[[gnu::const]]
const char *
ToString(TextFormat format) noexcept;

/**
 * Parse a format name ("text" or "html").
 *
 * @return false if the name is not known
 */
bool
ParseTextFormat(std::string_view s, TextFormat &format) noexcept;

/**
 * One text to be translated.  Language codes are opaque strings; only
 * #AUTO_LANGUAGE has a special meaning.
 */
struct TranslationUnit {
	std::string text;
	std::string source{AUTO_LANGUAGE};
	std::string target;
	TextFormat format = TextFormat::TEXT;

	bool IsAutoSource() const noexcept {
		return source == AUTO_LANGUAGE;
	}

	/**
	 * Is this a request to "translate" a text into the language it
	 * is already declared to be in?
	 */
	bool IsSameLanguage() const noexcept {
		return !IsAutoSource() && source == target;
	}
};

/**
 * Options shared by all units of a #BatchRequest.
 */
struct BatchOptions {
	/**
	 * Empty if no glossary was requested.
	 */
	std::string glossary_id;

	/**
	 * Empty if the provider's default shall be used.
	 */
	std::string formality;

	bool preserve_entities = false;
};

struct BatchRequest {
	std::vector<TranslationUnit> units;
	BatchOptions options;
};
