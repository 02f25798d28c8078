#include "disk/page_cache.hpp"
#include "storage/error.hpp"

#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace zephyrite::disk {

// ── Fake store ───────────────────────────────────────────────────────────────

// In-memory PageStore that records every write and can be told to fail.
class FakeStore : public PageStore {
public:
    Page read_page(PageId id) override {
        ++reads;
        if (auto it = pages.find(id); it != pages.end()) return it->second;
        return Page(id);
    }

    void write_page(const Page& page) override {
        if (fail_writes) {
            throw StorageError::internal("simulated write failure");
        }
        writes.push_back(page.id());
        pages.insert_or_assign(page.id(), page);
    }

    std::map<PageId, Page> pages;
    std::vector<PageId> writes;
    int reads = 0;
    bool fail_writes = false;
};

static Page dirty_page(PageId id, uint8_t marker) {
    Page page(id);
    const uint8_t byte[] = {marker};
    page.write(0, byte);
    return page;
}

// ── Fixture ──────────────────────────────────────────────────────────────────

class PageCacheTest : public ::testing::Test {
protected:
    FakeStore store_;
    PageCache cache_{store_, 3};
};

// ── Lookup ───────────────────────────────────────────────────────────────────

TEST_F(PageCacheTest, GetMissReturnsNull) {
    EXPECT_EQ(cache_.get(1), nullptr);
    EXPECT_EQ(cache_.stats().misses, 1u);
}

TEST_F(PageCacheTest, InsertThenGetHits) {
    cache_.insert(Page(1));
    auto* page = cache_.get(1);
    ASSERT_NE(page, nullptr);
    EXPECT_EQ(page->id(), 1u);
    EXPECT_TRUE(cache_.contains(1));
    EXPECT_EQ(cache_.stats().hits, 1u);
}

TEST_F(PageCacheTest, FetchLoadsFromStoreOnMiss) {
    store_.pages.insert_or_assign(5, dirty_page(5, 0x42));
    store_.pages.at(5).clear_dirty();

    auto& page = cache_.fetch(5);
    EXPECT_EQ(page.data()[0], 0x42);
    EXPECT_EQ(store_.reads, 1);

    (void)cache_.fetch(5);
    EXPECT_EQ(store_.reads, 1);

    auto s = cache_.stats();
    EXPECT_EQ(s.hits, 1u);
    EXPECT_EQ(s.misses, 1u);
    EXPECT_DOUBLE_EQ(s.hit_ratio, 0.5);
}

// ── Eviction ─────────────────────────────────────────────────────────────────

TEST_F(PageCacheTest, EvictsLeastRecentlyUsed) {
    cache_.insert(Page(1));
    cache_.insert(Page(2));
    cache_.insert(Page(3));

    (void)cache_.get(1);       // order now 1, 3, 2
    cache_.insert(Page(4));    // evicts 2

    EXPECT_TRUE(cache_.contains(1));
    EXPECT_FALSE(cache_.contains(2));
    EXPECT_TRUE(cache_.contains(3));
    EXPECT_TRUE(cache_.contains(4));
    EXPECT_EQ(cache_.size(), 3u);
}

TEST_F(PageCacheTest, EvictionWritesBackDirtyPage) {
    cache_.insert(dirty_page(1, 0x11));
    cache_.insert(Page(2));
    cache_.insert(Page(3));
    cache_.insert(Page(4));

    EXPECT_EQ(store_.writes, (std::vector<PageId>{1}));
    EXPECT_EQ(store_.pages.at(1).data()[0], 0x11);
}

TEST_F(PageCacheTest, EvictionOfCleanPageDoesNotWrite) {
    for (PageId id = 1; id <= 5; ++id) cache_.insert(Page(id));
    EXPECT_TRUE(store_.writes.empty());
}

TEST_F(PageCacheTest, FailedWriteBackKeepsPageCached) {
    cache_.insert(dirty_page(1, 0x11));
    cache_.insert(Page(2));
    cache_.insert(Page(3));

    store_.fail_writes = true;
    EXPECT_THROW(cache_.insert(Page(4)), StorageError);

    EXPECT_TRUE(cache_.contains(1));
    EXPECT_FALSE(cache_.contains(4));
    EXPECT_EQ(cache_.dirty_pages(), (std::vector<PageId>{1}));
}

// ── Replace / dirty tracking ─────────────────────────────────────────────────

TEST_F(PageCacheTest, ReplacingDirtyPageKeepsItDirty) {
    cache_.insert(dirty_page(1, 0x11));
    cache_.insert(Page(1));

    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_EQ(cache_.dirty_pages(), (std::vector<PageId>{1}));
    EXPECT_EQ(cache_.get(1)->data()[0], 0);
}

TEST_F(PageCacheTest, MarkDirty) {
    cache_.insert(Page(2));
    EXPECT_TRUE(cache_.mark_dirty(2));
    EXPECT_FALSE(cache_.mark_dirty(9));
    EXPECT_EQ(cache_.stats().dirty_pages, 1u);
}

TEST_F(PageCacheTest, FlushWritesDirtyPagesInIdOrder) {
    cache_.insert(dirty_page(3, 3));
    cache_.insert(Page(2));
    cache_.insert(dirty_page(1, 1));

    EXPECT_EQ(cache_.flush_dirty_pages(), (std::vector<PageId>{1, 3}));
    EXPECT_EQ(store_.writes, (std::vector<PageId>{1, 3}));
    EXPECT_TRUE(cache_.dirty_pages().empty());
    EXPECT_EQ(cache_.size(), 3u);

    EXPECT_TRUE(cache_.flush_dirty_pages().empty());
}

// ── Remove / clear ───────────────────────────────────────────────────────────

TEST_F(PageCacheTest, RemoveWritesBackAndReturnsCleanPage) {
    cache_.insert(dirty_page(1, 0x7F));

    auto removed = cache_.remove(1);
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(removed->is_dirty());
    EXPECT_EQ(removed->data()[0], 0x7F);
    EXPECT_EQ(store_.writes, (std::vector<PageId>{1}));
    EXPECT_FALSE(cache_.contains(1));

    EXPECT_FALSE(cache_.remove(1).has_value());
}

TEST_F(PageCacheTest, ClearFlushesThenEmpties) {
    cache_.insert(dirty_page(1, 1));
    cache_.insert(Page(2));

    cache_.clear();
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_EQ(store_.writes, (std::vector<PageId>{1}));
}

// ── Capacity 0 ───────────────────────────────────────────────────────────────

TEST(PageCacheZeroCapacity, HoldsNothing) {
    FakeStore store;
    PageCache cache(store, 0);

    cache.insert(Page(1));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_TRUE(store.writes.empty());

    cache.insert(dirty_page(2, 2));
    EXPECT_EQ(store.writes, (std::vector<PageId>{2}));

    try {
        (void)cache.fetch(1);
        FAIL() << "expected UnsupportedOperation";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), StorageErrorKind::UnsupportedOperation);
    }
    EXPECT_EQ(store.reads, 0);
}

TEST(PageCacheStatsTest, HitRatioIsZeroBeforeLookups) {
    FakeStore store;
    PageCache cache(store, 4);
    auto s = cache.stats();
    EXPECT_EQ(s.capacity, 4u);
    EXPECT_EQ(s.cached_pages, 0u);
    EXPECT_DOUBLE_EQ(s.hit_ratio, 0.0);
}

} // namespace zephyrite::disk
