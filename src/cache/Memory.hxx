// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "TranslationCache.hxx"
#include "Key.hxx"
#include "Entry.hxx"

#include <boost/intrusive/list.hpp>
#include <boost/intrusive/unordered_set.hpp>

#include <atomic>
#include <memory>
#include <mutex>

/**
 * The in-process #TranslationCache implementation: a hash table
 * with a bounded number of entries; the least recently used entry
 * is evicted when the table is full.
 */
class TranslationMemory final : public TranslationCache {
	struct Item {
		using LinkMode = boost::intrusive::link_mode<boost::intrusive::normal_link>;

		/**
		 * This item's siblings, sorted by last access.
		 */
		boost::intrusive::list_member_hook<LinkMode> sorted_siblings;

		boost::intrusive::unordered_set_member_hook<LinkMode> set_hook;

		const CacheKey key;

		const CacheEntry entry;

		Item(const CacheKey &_key, CacheEntry &&_entry) noexcept
			:key(_key), entry(std::move(_entry)) {}

		struct Hash {
			[[gnu::pure]]
			std::size_t operator()(const Item &item) const noexcept {
				return item.key.GetHash();
			}

			[[gnu::pure]]
			std::size_t operator()(const CacheKey &key) const noexcept {
				return key.GetHash();
			}
		};

		struct Equal {
			[[gnu::pure]]
			bool operator()(const Item &a, const Item &b) const noexcept {
				return a.key == b.key;
			}

			[[gnu::pure]]
			bool operator()(const CacheKey &a, const Item &b) const noexcept {
				return a == b.key;
			}
		};

		struct Disposer {
			void operator()(Item *item) const noexcept {
				delete item;
			}
		};
	};

	static constexpr std::size_t N_BUCKETS = 16381;

	using ItemSet =
		boost::intrusive::unordered_set<Item,
						boost::intrusive::member_hook<Item,
									      boost::intrusive::unordered_set_member_hook<Item::LinkMode>,
									      &Item::set_hook>,
						boost::intrusive::hash<Item::Hash>,
						boost::intrusive::equal<Item::Equal>,
						boost::intrusive::constant_time_size<true>>;

	using ItemList =
		boost::intrusive::list<Item,
				       boost::intrusive::member_hook<Item,
								     boost::intrusive::list_member_hook<Item::LinkMode>,
								     &Item::sorted_siblings>,
				       boost::intrusive::constant_time_size<false>>;

	const std::size_t max_entries;

	mutable std::mutex mutex;

	std::unique_ptr<ItemSet::bucket_type[]> buckets;

	ItemSet items;

	/**
	 * A linked list of all cache items, sorted by last access,
	 * oldest first.
	 */
	ItemList sorted_items;

	std::atomic<uint64_t> next_sequence{1};

public:
	/**
	 * @param _max_entries the maximum number of entries; 0 disables
	 * the cache
	 */
	explicit TranslationMemory(std::size_t _max_entries);
	~TranslationMemory() noexcept override;

	TranslationMemory(const TranslationMemory &) = delete;
	TranslationMemory &operator=(const TranslationMemory &) = delete;

	[[gnu::pure]]
	std::size_t GetSize() const noexcept;

	/**
	 * Remove all expired entries.
	 *
	 * @return the number of entries which were removed
	 */
	std::size_t Expire(Clock::time_point now) noexcept;

	void Flush() noexcept;

	/* virtual methods from class TranslationCache */
	uint64_t NextSequence() noexcept override;
	std::optional<CacheEntry> Lookup(const CacheKey &key,
					 Clock::time_point now) override;
	bool Store(const CacheKey &key,
		   std::string_view text, std::string_view detected_source,
		   Clock::duration ttl, uint64_t sequence,
		   Clock::time_point now) override;
	void Evict(const CacheKey &key) noexcept override;

private:
	ItemSet::iterator Find(const CacheKey &key) noexcept {
		return items.find(key, Item::Hash{}, Item::Equal{});
	}

	void RemoveItem(Item &item) noexcept;
	void RefreshItem(Item &item) noexcept;
	void DestroyOldestItem() noexcept;
};
