// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cache/Key.hxx"
#include "translation/Unit.hxx"

#include <gtest/gtest.h>

static TranslationUnit
MakeUnit(const char *text, const char *source, const char *target)
{
	TranslationUnit unit;
	unit.text = text;
	unit.source = source;
	unit.target = target;
	return unit;
}

TEST(CacheKey, Equal)
{
	const BatchOptions options;
	const CacheKey a{MakeUnit("Hello", "en", "es"), options};
	const CacheKey b{MakeUnit("Hello", "en", "es"), options};

	EXPECT_EQ(a, b);
	EXPECT_EQ(a.GetHash(), b.GetHash());
	EXPECT_EQ(a.GetValue(), b.GetValue());
}

TEST(CacheKey, NoNormalization)
{
	const BatchOptions options;
	const CacheKey a{MakeUnit("Hello", "en", "es"), options};

	EXPECT_NE(a, (CacheKey{MakeUnit("hello", "en", "es"), options}));
	EXPECT_NE(a, (CacheKey{MakeUnit("Hello ", "en", "es"), options}));
	EXPECT_NE(a, (CacheKey{MakeUnit("Hello", "EN", "es"), options}));
	EXPECT_NE(a, (CacheKey{MakeUnit("Hello", "auto", "es"), options}));
	EXPECT_NE(a, (CacheKey{MakeUnit("Hello", "en", "fr"), options}));
}

TEST(CacheKey, Format)
{
	const BatchOptions options;
	auto html = MakeUnit("<b>Hi</b>", "en", "de");
	html.format = TextFormat::HTML;

	EXPECT_NE((CacheKey{MakeUnit("<b>Hi</b>", "en", "de"), options}),
		  (CacheKey{html, options}));
}

TEST(CacheKey, Glossary)
{
	const auto unit = MakeUnit("Widget", "en", "de");

	BatchOptions a, b, c;
	a.glossary_id = "g1";
	b.glossary_id = "g2";

	EXPECT_NE((CacheKey{unit, a}), (CacheKey{unit, b}));
	EXPECT_NE((CacheKey{unit, a}), (CacheKey{unit, c}));
}

TEST(CacheKey, Options)
{
	const auto unit = MakeUnit("How are you?", "en", "de");

	BatchOptions formal, informal, preserve;
	formal.formality = "more";
	informal.formality = "less";
	preserve.preserve_entities = true;

	EXPECT_NE((CacheKey{unit, formal}), (CacheKey{unit, informal}));
	EXPECT_NE((CacheKey{unit, {}}), (CacheKey{unit, preserve}));
}

/**
 * Field boundaries must not be ambiguous.
 */
TEST(CacheKey, Boundaries)
{
	const BatchOptions options;

	EXPECT_NE((CacheKey{MakeUnit("ab", "c", "d"), options}),
		  (CacheKey{MakeUnit("a", "bc", "d"), options}));
	EXPECT_NE((CacheKey{MakeUnit("a", "b", "cd"), options}),
		  (CacheKey{MakeUnit("a", "bc", "d"), options}));
}
