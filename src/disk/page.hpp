#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace zephyrite::disk {

using PageId = uint64_t;

static constexpr std::size_t kPageSize = 4096;

// Page 0 holds the file header and is never handed out by the allocator.
static constexpr PageId kHeaderPageId = 0;

// ── Page ─────────────────────────────────────────────────────────────────────
//
// A fixed-size block of kPageSize bytes.  The buffer length never changes.
// write() marks the page dirty; only the owner that persists the page
// (PageCache) clears the flag.

class Page {
public:
    // A zero-filled, clean page.
    explicit Page(PageId id);

    // A clean page holding `data`, zero-padded to kPageSize.
    // Throws StorageError (Internal) if `data` is larger than a page.
    [[nodiscard]] static Page from_data(PageId id, std::span<const uint8_t> data);

    [[nodiscard]] PageId id() const noexcept { return id_; }

    [[nodiscard]] std::span<const uint8_t> data() const noexcept { return data_; }

    // Copies `bytes` to [offset, offset + bytes.size()) and marks the page
    // dirty.  Throws StorageError (Internal) if the range leaves the page.
    void write(std::size_t offset, std::span<const uint8_t> bytes);

    // View of [offset, offset + length).  Throws StorageError (Internal) if
    // the range leaves the page.
    [[nodiscard]] std::span<const uint8_t> read(std::size_t offset, std::size_t length) const;

    void mark_dirty() noexcept { dirty_ = true; }
    void clear_dirty() noexcept { dirty_ = false; }
    [[nodiscard]] bool is_dirty() const noexcept { return dirty_; }

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    bool operator==(const Page&) const = default;

private:
    PageId id_;
    std::vector<uint8_t> data_;
    bool dirty_ = false;
};

} // namespace zephyrite::disk
