// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Language.hxx"

#include <algorithm>
#include <array>

#include <strings.h>

const char *
ToString(TextDirection direction) noexcept
{
	switch (direction) {
	case TextDirection::LTR:
		return "ltr";

	case TextDirection::RTL:
		return "rtl";
	}

	return "ltr";
}

static const std::array builtin_languages{
	LanguageInfo{"ar", "Arabic", TextDirection::RTL, true},
	LanguageInfo{"bg", "Bulgarian", TextDirection::LTR, true},
	LanguageInfo{"cs", "Czech", TextDirection::LTR, false},
	LanguageInfo{"da", "Danish", TextDirection::LTR, false},
	LanguageInfo{"de", "German", TextDirection::LTR, false},
	LanguageInfo{"el", "Greek", TextDirection::LTR, true},
	LanguageInfo{"en", "English", TextDirection::LTR, false},
	LanguageInfo{"es", "Spanish", TextDirection::LTR, false},
	LanguageInfo{"et", "Estonian", TextDirection::LTR, false},
	LanguageInfo{"fa", "Persian", TextDirection::RTL, true},
	LanguageInfo{"fi", "Finnish", TextDirection::LTR, false},
	LanguageInfo{"fr", "French", TextDirection::LTR, false},
	LanguageInfo{"he", "Hebrew", TextDirection::RTL, true},
	LanguageInfo{"hi", "Hindi", TextDirection::LTR, true},
	LanguageInfo{"hu", "Hungarian", TextDirection::LTR, false},
	LanguageInfo{"id", "Indonesian", TextDirection::LTR, false},
	LanguageInfo{"it", "Italian", TextDirection::LTR, false},
	LanguageInfo{"ja", "Japanese", TextDirection::LTR, true},
	LanguageInfo{"ko", "Korean", TextDirection::LTR, true},
	LanguageInfo{"lt", "Lithuanian", TextDirection::LTR, false},
	LanguageInfo{"lv", "Latvian", TextDirection::LTR, false},
	LanguageInfo{"nb", "Norwegian Bokmål", TextDirection::LTR, false},
	LanguageInfo{"nl", "Dutch", TextDirection::LTR, false},
	LanguageInfo{"pl", "Polish", TextDirection::LTR, false},
	LanguageInfo{"pt", "Portuguese", TextDirection::LTR, false},
	LanguageInfo{"ro", "Romanian", TextDirection::LTR, false},
	LanguageInfo{"ru", "Russian", TextDirection::LTR, true},
	LanguageInfo{"sk", "Slovak", TextDirection::LTR, false},
	LanguageInfo{"sl", "Slovenian", TextDirection::LTR, false},
	LanguageInfo{"sv", "Swedish", TextDirection::LTR, false},
	LanguageInfo{"th", "Thai", TextDirection::LTR, true},
	LanguageInfo{"tr", "Turkish", TextDirection::LTR, false},
	LanguageInfo{"uk", "Ukrainian", TextDirection::LTR, true},
	LanguageInfo{"ur", "Urdu", TextDirection::RTL, true},
	LanguageInfo{"zh", "Chinese", TextDirection::LTR, true},
};

[[gnu::pure]]
static const LanguageInfo *
FindExact(std::string_view code) noexcept
{
	for (const auto &i : builtin_languages)
		if (i.code.size() == code.size() &&
		    strncasecmp(i.code.data(), code.data(), code.size()) == 0)
			return &i;

	return nullptr;
}

const LanguageInfo *
FindBuiltinLanguage(std::string_view code) noexcept
{
	if (const auto *l = FindExact(code))
		return l;

	/* try the base language of a regional code */
	const auto dash = code.find_first_of("-_");
	if (dash != code.npos && dash > 0)
		return FindExact(code.substr(0, dash));

	return nullptr;
}

[[gnu::pure]]
static bool
IsSameCode(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		strncasecmp(a.data(), b.data(), a.size()) == 0;
}

std::vector<LanguageInfo>
MergeLanguageCatalog(std::span<const LanguageInfo> reported)
{
	std::vector<LanguageInfo> result;
	result.reserve(reported.size());

	for (const auto &i : reported) {
		if (i.code.empty())
			continue;

		if (std::any_of(result.begin(), result.end(),
				[&i](const LanguageInfo &l){
					return IsSameCode(l.code, i.code);
				}))
			continue;

		LanguageInfo l = i;

		if (const auto *b = FindBuiltinLanguage(i.code)) {
			if (l.name.empty())
				l.name = b->name;
			l.direction = b->direction;
			l.supports_transliteration = l.supports_transliteration ||
				b->supports_transliteration;
		}

		if (l.name.empty())
			l.name = l.code;

		result.emplace_back(std::move(l));
	}

	std::sort(result.begin(), result.end(),
		  [](const LanguageInfo &a, const LanguageInfo &b){
			  return a.code < b.code;
		  });

	return result;
}
