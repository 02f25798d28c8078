#include "disk/page_allocator.hpp"
#include "storage/error.hpp"

#include <vector>

#include <gtest/gtest.h>

namespace zephyrite::disk {

// ── Allocation ───────────────────────────────────────────────────────────────

TEST(PageAllocatorTest, StartsAtPageOne) {
    PageAllocator alloc;
    EXPECT_EQ(alloc.next_page_id(), 1u);
    EXPECT_EQ(alloc.total_pages(), 0u);
    EXPECT_EQ(alloc.allocate(), 1u);
    EXPECT_EQ(alloc.allocate(), 2u);
    EXPECT_EQ(alloc.total_pages(), 2u);
}

TEST(PageAllocatorTest, ReusesLargestFreedIdFirst) {
    PageAllocator alloc;
    for (int i = 0; i < 4; ++i) (void)alloc.allocate();

    alloc.free(2);
    alloc.free(4);
    EXPECT_EQ(alloc.free_page_count(), 2u);

    EXPECT_EQ(alloc.allocate(), 4u);
    EXPECT_EQ(alloc.allocate(), 2u);
    EXPECT_EQ(alloc.allocate(), 5u);
    EXPECT_EQ(alloc.free_page_count(), 0u);
}

TEST(PageAllocatorTest, FreeListStaysSorted) {
    PageAllocator alloc;
    for (int i = 0; i < 6; ++i) (void)alloc.allocate();

    alloc.free(5);
    alloc.free(1);
    alloc.free(3);
    EXPECT_EQ(alloc.free_pages(), (std::vector<PageId>{1, 3, 5}));
    EXPECT_TRUE(alloc.is_free(3));
    EXPECT_FALSE(alloc.is_free(4));
}

TEST(PageAllocatorTest, DoubleFreeIsNoOp) {
    PageAllocator alloc;
    (void)alloc.allocate();
    (void)alloc.allocate();

    alloc.free(1);
    alloc.free(1);
    EXPECT_EQ(alloc.free_page_count(), 1u);
    EXPECT_EQ(alloc.allocate(), 1u);
    EXPECT_EQ(alloc.allocate(), 3u);
}

TEST(PageAllocatorTest, FreeingHeaderPageThrows) {
    PageAllocator alloc;
    (void)alloc.allocate();
    EXPECT_THROW(alloc.free(kHeaderPageId), StorageError);
}

TEST(PageAllocatorTest, FreeingUnallocatedIdThrows) {
    PageAllocator alloc;
    (void)alloc.allocate();
    try {
        alloc.free(2);
        FAIL() << "expected Internal StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.kind(), StorageErrorKind::Internal);
    }
    EXPECT_EQ(alloc.free_page_count(), 0u);
}

// ── Restore ──────────────────────────────────────────────────────────────────

TEST(PageAllocatorTest, RestoreSortsAndDeduplicates) {
    PageAllocator alloc(10, {7, 3, 7, 5});
    EXPECT_EQ(alloc.next_page_id(), 10u);
    EXPECT_EQ(alloc.total_pages(), 9u);
    EXPECT_EQ(alloc.free_pages(), (std::vector<PageId>{3, 5, 7}));
    EXPECT_EQ(alloc.allocate(), 7u);
}

TEST(PageAllocatorTest, RestoreRejectsInvalidState) {
    EXPECT_THROW(PageAllocator(0, {}), StorageError);
    EXPECT_THROW(PageAllocator(5, {0}), StorageError);
    EXPECT_THROW(PageAllocator(5, {5}), StorageError);
    EXPECT_NO_THROW(PageAllocator(5, {4}));
}

} // namespace zephyrite::disk
