#pragma once

#include "disk/page.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <vector>

namespace zephyrite::disk {

// ── PageStore ────────────────────────────────────────────────────────────────
//
// Backing store a PageCache loads pages from and writes dirty pages back to.
// Implementations throw StorageError on I/O failure.

class PageStore {
public:
    virtual ~PageStore() = default;

    [[nodiscard]] virtual Page read_page(PageId id) = 0;
    virtual void write_page(const Page& page) = 0;
};

struct PageCacheStats {
    std::size_t capacity = 0;
    std::size_t cached_pages = 0;
    std::size_t dirty_pages = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_ratio = 0.0;   // hits / (hits + misses), 0 before any lookup
};

// ── PageCache ────────────────────────────────────────────────────────────────
//
// Fixed-capacity LRU cache of pages in front of a PageStore.
//
//   lru_   : std::list<Page>, most recently used at the front
//   index_ : PageId → iterator into lru_
//
// A dirty page is written back to the store before it leaves the cache
// (eviction, remove(), clear(), or insert() with capacity 0).  If that write
// fails the page stays cached, dirty, and the StorageError propagates.
//
// Not thread-safe: callers must hold an external lock around every call.

class PageCache {
public:
    PageCache(PageStore& store, std::size_t capacity);

    PageCache(const PageCache&) = delete;
    PageCache& operator=(const PageCache&) = delete;

    // Cached page or nullptr.  A hit promotes the page to most recently used.
    // The pointer is valid until the next mutating call.
    [[nodiscard]] Page* get(PageId id);

    // Cached page, loading it from the store on a miss.  Throws StorageError
    // (UnsupportedOperation) when the capacity is 0.
    [[nodiscard]] Page& fetch(PageId id);

    // Inserts or replaces `page` as most recently used, evicting the least
    // recently used page first if the cache is full.  Replacing a dirty page
    // keeps the entry dirty.
    void insert(Page page);

    // Marks a cached page dirty.  Returns false if `id` is not cached.
    bool mark_dirty(PageId id);

    // Ids of dirty cached pages, ascending.
    [[nodiscard]] std::vector<PageId> dirty_pages() const;

    // Removes `id` after writing it back if dirty.  The returned page is clean.
    std::optional<Page> remove(PageId id);

    [[nodiscard]] bool contains(PageId id) const { return index_.contains(id); }

    [[nodiscard]] std::size_t size() const noexcept { return index_.size(); }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    // Writes back every dirty page, then drops all pages.
    void clear();

    // Writes back every dirty page and clears its flag.  Returns the ids
    // written, ascending.
    std::vector<PageId> flush_dirty_pages();

    [[nodiscard]] PageCacheStats stats() const;

private:
    using LruList = std::list<Page>;

    void write_back(Page& page);
    void evict_one();

    PageStore& store_;
    std::size_t capacity_;

    LruList lru_;
    std::unordered_map<PageId, LruList::iterator> index_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
};

} // namespace zephyrite::disk
