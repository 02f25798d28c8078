#include "disk/page_cache.hpp"
#include "disk/page_file.hpp"
#include "storage/error.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace zephyrite::disk {

// ── Fixture ──────────────────────────────────────────────────────────────────

class PageFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("zephyrite_page_file_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        path_ = test_dir_ / "data.zph";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path path_;
};

static std::vector<uint8_t> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

// ── Create / open ────────────────────────────────────────────────────────────

TEST_F(PageFileTest, CreateWritesHeaderPage) {
    auto file = PageFile::create(path_);
    EXPECT_EQ(std::filesystem::file_size(path_), kPageSize);
    EXPECT_EQ(file->header(), FileHeader{});
    EXPECT_EQ(file->allocator().next_page_id(), 1u);
    EXPECT_EQ(file->path(), path_);
}

TEST_F(PageFileTest, OpenMissingFileFails) {
    EXPECT_THROW((void)PageFile::open(path_), StorageError);
}

TEST_F(PageFileTest, OpenRejectsForeignFile) {
    {
        std::ofstream out(path_, std::ios::binary);
        out << std::string(kPageSize, 'x');
    }
    try {
        (void)PageFile::open(path_);
        FAIL() << "expected Internal StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.detail(), "Invalid Zephyrite file identifier");
    }
}

TEST_F(PageFileTest, OpenRejectsTruncatedHeader) {
    {
        std::ofstream out(path_, std::ios::binary);
        out << "ZEPHYRITE";
    }
    EXPECT_THROW((void)PageFile::open(path_), StorageError);
}

// ── Page I/O ─────────────────────────────────────────────────────────────────

TEST_F(PageFileTest, WrittenPageReadsBack) {
    auto file = PageFile::create(path_);
    auto id = file->allocate_page();
    EXPECT_EQ(id, 1u);

    Page page(id);
    page.write(10, bytes("hello"));
    file->write_page(page);

    auto loaded = file->read_page(id);
    EXPECT_EQ(loaded.id(), id);
    EXPECT_FALSE(loaded.is_dirty());
    auto view = loaded.read(10, 5);
    EXPECT_EQ(std::string(view.begin(), view.end()), "hello");
}

TEST_F(PageFileTest, UnwrittenPageReadsAsZeros) {
    auto file = PageFile::create(path_);
    auto id = file->allocate_page();
    EXPECT_EQ(file->read_page(id), Page(id));
}

TEST_F(PageFileTest, HeaderPageIsNotAddressable) {
    auto file = PageFile::create(path_);
    EXPECT_THROW((void)file->read_page(kHeaderPageId), StorageError);
    EXPECT_THROW(file->write_page(Page(kHeaderPageId)), StorageError);
}

TEST_F(PageFileTest, UnallocatedPagesAreRejected) {
    auto file = PageFile::create(path_);
    EXPECT_THROW((void)file->read_page(1), StorageError);

    auto id = file->allocate_page();
    file->free_page(id);
    EXPECT_THROW((void)file->read_page(id), StorageError);
    EXPECT_THROW(file->write_page(Page(id)), StorageError);
}

// ── Persistence ──────────────────────────────────────────────────────────────

TEST_F(PageFileTest, ReopenRestoresPagesAndAllocator) {
    {
        auto file = PageFile::create(path_);
        for (int i = 0; i < 5; ++i) (void)file->allocate_page();

        Page page(3);
        page.write(0, bytes("page three"));
        file->write_page(page);

        file->free_page(2);
        file->free_page(4);
        file->set_index_page_id(5);
    }

    auto file = PageFile::open(path_);
    EXPECT_EQ(file->header().next_page, 6u);
    EXPECT_EQ(file->header().free_pages_count, 2u);
    EXPECT_EQ(file->header().index_page_id, 5u);
    EXPECT_EQ(file->allocator().free_pages(), (std::vector<PageId>{2, 4}));

    auto view = file->read_page(3).read(0, 10);
    EXPECT_EQ(std::string(view.begin(), view.end()), "page three");

    EXPECT_EQ(file->allocate_page(), 4u);
    EXPECT_EQ(file->allocate_page(), 2u);
    EXPECT_EQ(file->allocate_page(), 6u);
}

TEST_F(PageFileTest, OverflowingFreeListKeepsLargestIds) {
    const std::size_t total = kMaxPersistedFreePages + 10;
    {
        auto file = PageFile::create(path_);
        for (std::size_t i = 0; i < total; ++i) (void)file->allocate_page();
        for (PageId id = 1; id <= total; ++id) file->free_page(id);
        file->sync();
    }

    auto file = PageFile::open(path_);
    const auto& free_ids = file->allocator().free_pages();
    ASSERT_EQ(free_ids.size(), kMaxPersistedFreePages);
    EXPECT_EQ(free_ids.front(), 11u);
    EXPECT_EQ(free_ids.back(), total);
}

// ── With a PageCache ─────────────────────────────────────────────────────────

TEST_F(PageFileTest, CacheWritesBackThroughFile) {
    auto file = PageFile::create(path_);
    auto a = file->allocate_page();
    auto b = file->allocate_page();

    {
        PageCache cache(*file, 1);
        auto& page = cache.fetch(a);
        page.write(0, bytes("cached"));
        (void)cache.fetch(b);   // evicts a, writing it back
        EXPECT_FALSE(cache.contains(a));
    }

    auto view = file->read_page(a).read(0, 6);
    EXPECT_EQ(std::string(view.begin(), view.end()), "cached");
}

} // namespace zephyrite::disk
