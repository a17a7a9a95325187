// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "cache/Memory.hxx"
#include "cache/Entry.hxx"
#include "cache/Key.hxx"
#include "translation/Unit.hxx"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

static CacheKey
MakeKey(const char *text, const char *target="es")
{
	TranslationUnit unit;
	unit.text = text;
	unit.source = "en";
	unit.target = target;
	return {unit, BatchOptions{}};
}

TEST(TranslationMemory, StoreLookup)
{
	TranslationMemory memory(16);
	const auto now = TranslationCache::Clock::now();
	const auto key = MakeKey("Hello");

	EXPECT_FALSE(memory.Lookup(key, now));

	ASSERT_TRUE(memory.Store(key, "Hola", "en", 1h,
				 memory.NextSequence(), now));
	EXPECT_EQ(memory.GetSize(), 1U);

	const auto entry = memory.Lookup(key, now + 1min);
	ASSERT_TRUE(entry);
	EXPECT_EQ(entry->text, "Hola");
	EXPECT_EQ(entry->detected_source, "en");

	EXPECT_FALSE(memory.Lookup(MakeKey("Hello", "fr"), now));
}

TEST(TranslationMemory, Ttl)
{
	TranslationMemory memory(16);
	const auto now = TranslationCache::Clock::now();
	const auto key = MakeKey("Hello");

	ASSERT_TRUE(memory.Store(key, "Hola", {}, 10s, 1, now));
	EXPECT_TRUE(memory.Lookup(key, now + 9s));
	EXPECT_FALSE(memory.Lookup(key, now + 10s));

	/* the expired entry has been removed */
	EXPECT_EQ(memory.GetSize(), 0U);
}

TEST(TranslationMemory, ZeroTtl)
{
	TranslationMemory memory(16);
	const auto now = TranslationCache::Clock::now();

	EXPECT_FALSE(memory.Store(MakeKey("Hello"), "Hola", {}, 0s, 1, now));
	EXPECT_EQ(memory.GetSize(), 0U);
}

TEST(TranslationMemory, Disabled)
{
	TranslationMemory memory(0);
	const auto now = TranslationCache::Clock::now();

	EXPECT_FALSE(memory.Store(MakeKey("Hello"), "Hola", {}, 1h, 1, now));
	EXPECT_FALSE(memory.Lookup(MakeKey("Hello"), now));
}

TEST(TranslationMemory, Sequence)
{
	TranslationMemory memory(16);
	const auto now = TranslationCache::Clock::now();
	const auto key = MakeKey("Hello");

	const auto older = memory.NextSequence();
	const auto newer = memory.NextSequence();
	EXPECT_GT(newer, older);

	/* the later dispatch returns first */
	ASSERT_TRUE(memory.Store(key, "new", {}, 1h, newer, now));

	/* the earlier dispatch must not overwrite it */
	EXPECT_FALSE(memory.Store(key, "old", {}, 1h, older, now + 1s));
	EXPECT_EQ(memory.Lookup(key, now + 2s)->text, "new");

	/* a later one does */
	EXPECT_TRUE(memory.Store(key, "newest", {}, 1h,
				 memory.NextSequence(), now + 3s));
	EXPECT_EQ(memory.Lookup(key, now + 4s)->text, "newest");
}

TEST(TranslationMemory, SequenceExpired)
{
	TranslationMemory memory(16);
	const auto now = TranslationCache::Clock::now();
	const auto key = MakeKey("Hello");

	ASSERT_TRUE(memory.Store(key, "new", {}, 10s, 5, now));

	/* an expired entry does not block older sequence numbers */
	EXPECT_TRUE(memory.Store(key, "old", {}, 10s, 4, now + 20s));
	EXPECT_EQ(memory.Lookup(key, now + 21s)->text, "old");
}

TEST(TranslationMemory, Lru)
{
	TranslationMemory memory(2);
	const auto now = TranslationCache::Clock::now();

	ASSERT_TRUE(memory.Store(MakeKey("a"), "A", {}, 1h, 1, now));
	ASSERT_TRUE(memory.Store(MakeKey("b"), "B", {}, 1h, 2, now));

	/* refresh "a", so "b" is the oldest */
	EXPECT_TRUE(memory.Lookup(MakeKey("a"), now));

	ASSERT_TRUE(memory.Store(MakeKey("c"), "C", {}, 1h, 3, now));
	EXPECT_EQ(memory.GetSize(), 2U);

	EXPECT_TRUE(memory.Lookup(MakeKey("a"), now));
	EXPECT_FALSE(memory.Lookup(MakeKey("b"), now));
	EXPECT_TRUE(memory.Lookup(MakeKey("c"), now));
}

TEST(TranslationMemory, Expire)
{
	TranslationMemory memory(16);
	const auto now = TranslationCache::Clock::now();

	ASSERT_TRUE(memory.Store(MakeKey("a"), "A", {}, 10s, 1, now));
	ASSERT_TRUE(memory.Store(MakeKey("b"), "B", {}, 1h, 2, now));
	ASSERT_TRUE(memory.Store(MakeKey("c"), "C", {}, 20s, 3, now));

	EXPECT_EQ(memory.Expire(now + 5s), 0U);
	EXPECT_EQ(memory.Expire(now + 30s), 2U);
	EXPECT_EQ(memory.GetSize(), 1U);
	EXPECT_TRUE(memory.Lookup(MakeKey("b"), now + 30s));
}

TEST(TranslationMemory, Evict)
{
	TranslationMemory memory(16);
	const auto now = TranslationCache::Clock::now();

	ASSERT_TRUE(memory.Store(MakeKey("a"), "A", {}, 1h, 1, now));
	memory.Evict(MakeKey("a"));
	EXPECT_FALSE(memory.Lookup(MakeKey("a"), now));

	ASSERT_TRUE(memory.Store(MakeKey("b"), "B", {}, 1h, 2, now));
	memory.Flush();
	EXPECT_EQ(memory.GetSize(), 0U);
}
