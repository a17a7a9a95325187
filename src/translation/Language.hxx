// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

enum class TextDirection : uint_least8_t {
	LTR,
	RTL,
};

[[gnu::const]]
const char *
ToString(TextDirection direction) noexcept;

struct LanguageInfo {
	std::string code;
	std::string name;
	TextDirection direction = TextDirection::LTR;
	bool supports_transliteration = false;
};

/**
 * Look up a language in the built-in catalog.  The comparison is
 * case-insensitive, and a regional code ("pt-BR") falls back to its
 * base language ("pt").
 *
 * @return nullptr if the language is not known
 */
[[gnu::pure]]
const LanguageInfo *
FindBuiltinLanguage(std::string_view code) noexcept;

/**
 * Complete the languages reported by a provider with the data from
 * the built-in catalog, remove duplicates and sort by code.
 */
std::vector<LanguageInfo>
MergeLanguageCatalog(std::span<const LanguageInfo> reported);
