// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Memory.hxx"

#include <cassert>

TranslationMemory::TranslationMemory(std::size_t _max_entries)
	:max_entries(_max_entries),
	 buckets(new ItemSet::bucket_type[N_BUCKETS]),
	 items(ItemSet::bucket_traits(buckets.get(), N_BUCKETS))
{
}

TranslationMemory::~TranslationMemory() noexcept
{
	Flush();
}

std::size_t
TranslationMemory::GetSize() const noexcept
{
	const std::scoped_lock lock{mutex};
	return items.size();
}

uint64_t
TranslationMemory::NextSequence() noexcept
{
	return next_sequence.fetch_add(1, std::memory_order_relaxed);
}

void
TranslationMemory::RemoveItem(Item &item) noexcept
{
	sorted_items.erase(sorted_items.iterator_to(item));
	items.erase_and_dispose(items.iterator_to(item), Item::Disposer{});
}

void
TranslationMemory::RefreshItem(Item &item) noexcept
{
	/* move to the end of the linked list */
	sorted_items.erase(sorted_items.iterator_to(item));
	sorted_items.push_back(item);
}

void
TranslationMemory::DestroyOldestItem() noexcept
{
	if (sorted_items.empty())
		return;

	RemoveItem(sorted_items.front());
}

std::optional<CacheEntry>
TranslationMemory::Lookup(const CacheKey &key, Clock::time_point now)
{
	const std::scoped_lock lock{mutex};

	auto i = Find(key);
	if (i == items.end())
		return std::nullopt;

	Item &item = *i;
	if (item.entry.IsExpired(now)) {
		RemoveItem(item);
		return std::nullopt;
	}

	RefreshItem(item);
	return item.entry;
}

bool
TranslationMemory::Store(const CacheKey &key,
			 std::string_view text,
			 std::string_view detected_source,
			 Clock::duration ttl, uint64_t sequence,
			 Clock::time_point now)
{
	if (max_entries == 0 || ttl <= Clock::duration::zero())
		return false;

	CacheEntry entry{
		.text = std::string{text},
		.detected_source = std::string{detected_source},
		.created = now,
		.expires = now + ttl,
		.sequence = sequence,
	};

	auto *item = new Item(key, std::move(entry));

	const std::scoped_lock lock{mutex};

	if (auto i = Find(key); i != items.end()) {
		if (!i->entry.IsExpired(now) && i->entry.sequence > sequence) {
			/* a result from a later dispatch is already
			   here */
			delete item;
			return false;
		}

		RemoveItem(*i);
	}

	while (items.size() >= max_entries)
		DestroyOldestItem();

	items.insert(*item);
	sorted_items.push_back(*item);
	return true;
}

void
TranslationMemory::Evict(const CacheKey &key) noexcept
{
	const std::scoped_lock lock{mutex};

	auto i = Find(key);
	if (i != items.end())
		RemoveItem(*i);
}

std::size_t
TranslationMemory::Expire(Clock::time_point now) noexcept
{
	const std::scoped_lock lock{mutex};

	std::size_t removed = 0;
	for (auto i = sorted_items.begin(), end = sorted_items.end(); i != end;) {
		Item &item = *i++;

		if (!item.entry.IsExpired(now))
			/* not yet expired */
			continue;

		RemoveItem(item);
		++removed;
	}

	return removed;
}

void
TranslationMemory::Flush() noexcept
{
	const std::scoped_lock lock{mutex};

	sorted_items.clear();
	items.clear_and_dispose(Item::Disposer{});
}
