#pragma once

#include "disk/page.hpp"

#include <cstddef>
#include <vector>

namespace zephyrite::disk {

// ── PageAllocator ────────────────────────────────────────────────────────────
//
// Hands out page ids.  Ids start at 1 (page 0 is the file header).  Freed ids
// are kept sorted ascending; allocate() pops the largest free id before
// minting a new one.
//
// Not thread-safe; the owner serialises access.

class PageAllocator {
public:
    PageAllocator() = default;

    // Restores persisted state.  `free_pages` may be in any order; duplicates
    // are dropped.  Throws StorageError (Internal) if next_page_id is 0 or a
    // free id lies outside [1, next_page_id).
    PageAllocator(PageId next_page_id, std::vector<PageId> free_pages);

    [[nodiscard]] PageId allocate();

    // Returns `id` to the free list.  Freeing an already-free id is a no-op.
    // Throws StorageError (Internal) for id 0 or an id that was never handed
    // out.
    void free(PageId id);

    [[nodiscard]] bool is_free(PageId id) const;

    [[nodiscard]] PageId next_page_id() const noexcept { return next_page_id_; }

    [[nodiscard]] const std::vector<PageId>& free_pages() const noexcept { return free_pages_; }

    [[nodiscard]] std::size_t free_page_count() const noexcept { return free_pages_.size(); }

    // Number of ids ever minted (free or in use).
    [[nodiscard]] uint64_t total_pages() const noexcept { return next_page_id_ - 1; }

private:
    PageId next_page_id_ = 1;
    std::vector<PageId> free_pages_;
};

} // namespace zephyrite::disk
