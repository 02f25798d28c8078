#pragma once

#include "disk/file_header.hpp"
#include "disk/page.hpp"
#include "disk/page_allocator.hpp"
#include "disk/page_cache.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>

namespace zephyrite::disk {

// Free ids that fit in page 0 after the header.
static constexpr std::size_t kMaxPersistedFreePages = (kPageSize - kFileHeaderSize) / sizeof(PageId);

// ── PageFile ─────────────────────────────────────────────────────────────────
//
// A PageStore over a single file of kPageSize pages.  Page N lives at byte
// offset N * kPageSize.  Page 0 holds the FileHeader followed by the free
// list as little-endian u64 ids (at most kMaxPersistedFreePages).
//
// Allocator state is only made durable by sync().  Not thread-safe.

class PageFile final : public PageStore {
    // Restricts construction to create() and open().
    struct Token {
        explicit Token() = default;
    };

public:
    // Creates a new file at `path` (truncating any existing one) with an empty
    // allocator and writes page 0.
    [[nodiscard]] static std::unique_ptr<PageFile> create(const std::filesystem::path& path);

    // Opens an existing file, validates the header and restores the allocator.
    [[nodiscard]] static std::unique_ptr<PageFile> open(const std::filesystem::path& path);

    // Syncs before closing; a failure is logged.
    ~PageFile() override;

    PageFile(Token, std::filesystem::path path, int fd, FileHeader header,
             PageAllocator allocator);

    PageFile(const PageFile&) = delete;
    PageFile& operator=(const PageFile&) = delete;

    // Reads an allocated page.  Pages that were allocated but never written
    // read back as zeros.  Throws StorageError (Internal) for page 0, an id
    // that is not allocated, or an I/O error.
    [[nodiscard]] Page read_page(PageId id) override;

    // Writes an allocated page in place.  Does not touch the dirty flag.
    void write_page(const Page& page) override;

    [[nodiscard]] PageId allocate_page();
    void free_page(PageId id);

    // Persists header and free list to page 0 and fsyncs the file.
    void sync();

    void set_index_page_id(PageId id) noexcept { header_.index_page_id = id; }

    [[nodiscard]] const FileHeader& header() const noexcept { return header_; }
    [[nodiscard]] const PageAllocator& allocator() const noexcept { return allocator_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void check_allocated(PageId id) const;

    std::filesystem::path path_;
    int fd_;
    FileHeader header_;
    PageAllocator allocator_;
};

} // namespace zephyrite::disk
