// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "translation/Language.hxx"
#include "translation/Unit.hxx"

#include <gtest/gtest.h>

TEST(Language, FindBuiltin)
{
	const auto *l = FindBuiltinLanguage("de");
	ASSERT_NE(l, nullptr);
	EXPECT_EQ(l->name, "German");

	l = FindBuiltinLanguage("AR");
	ASSERT_NE(l, nullptr);
	EXPECT_EQ(l->code, "ar");
	EXPECT_EQ(l->direction, TextDirection::RTL);

	/* regional codes fall back to the base language */
	l = FindBuiltinLanguage("pt-BR");
	ASSERT_NE(l, nullptr);
	EXPECT_EQ(l->code, "pt");

	EXPECT_EQ(FindBuiltinLanguage("xx"), nullptr);
	EXPECT_EQ(FindBuiltinLanguage(""), nullptr);
	EXPECT_EQ(FindBuiltinLanguage("-x"), nullptr);
}

TEST(Language, Merge)
{
	const LanguageInfo reported[] = {
		{.code = "he"},
		{.code = "en", .name = "English (US)"},
		{.code = ""},
		{.code = "EN"},
		{.code = "tlh"},
	};

	const auto merged = MergeLanguageCatalog(reported);
	ASSERT_EQ(merged.size(), 3U);

	EXPECT_EQ(merged[0].code, "en");
	EXPECT_EQ(merged[0].name, "English (US)");
	EXPECT_EQ(merged[1].code, "he");
	EXPECT_EQ(merged[1].name, "Hebrew");
	EXPECT_EQ(merged[1].direction, TextDirection::RTL);
	EXPECT_TRUE(merged[1].supports_transliteration);
	EXPECT_EQ(merged[2].code, "tlh");
	EXPECT_EQ(merged[2].name, "tlh");
}

TEST(Language, Unit)
{
	TranslationUnit unit;
	unit.text = "Hallo";
	unit.target = "de";
	EXPECT_TRUE(unit.IsAutoSource());
	EXPECT_FALSE(unit.IsSameLanguage());

	unit.source = "de";
	EXPECT_FALSE(unit.IsAutoSource());
	EXPECT_TRUE(unit.IsSameLanguage());

	TextFormat format;
	EXPECT_TRUE(ParseTextFormat("html", format));
	EXPECT_EQ(format, TextFormat::HTML);
	EXPECT_STREQ(ToString(format), "html");
	EXPECT_FALSE(ParseTextFormat("pdf", format));
}
