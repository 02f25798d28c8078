#include "disk/page_allocator.hpp"

#include "storage/error.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace zephyrite::disk {

PageAllocator::PageAllocator(PageId next_page_id, std::vector<PageId> free_pages)
    : next_page_id_(next_page_id), free_pages_(std::move(free_pages))
{
    if (next_page_id_ == 0) {
        throw StorageError::internal("Invalid allocator state: next page id cannot be 0");
    }

    std::sort(free_pages_.begin(), free_pages_.end());
    free_pages_.erase(std::unique(free_pages_.begin(), free_pages_.end()), free_pages_.end());

    if (!free_pages_.empty() &&
        (free_pages_.front() == kHeaderPageId || free_pages_.back() >= next_page_id_)) {
        throw StorageError::internal(fmt::format(
            "Invalid allocator state: free ids must lie in [1, {})", next_page_id_));
    }
}

PageId PageAllocator::allocate() {
    if (!free_pages_.empty()) {
        PageId id = free_pages_.back();
        free_pages_.pop_back();
        return id;
    }
    return next_page_id_++;
}

void PageAllocator::free(PageId id) {
    if (id == kHeaderPageId) {
        throw StorageError::internal("Cannot free page 0 (file header)");
    }
    if (id >= next_page_id_) {
        throw StorageError::internal(fmt::format(
            "Cannot free page {}: never allocated (next page id {})", id, next_page_id_));
    }

    auto it = std::lower_bound(free_pages_.begin(), free_pages_.end(), id);
    if (it != free_pages_.end() && *it == id) return;
    free_pages_.insert(it, id);
}

bool PageAllocator::is_free(PageId id) const {
    return std::binary_search(free_pages_.begin(), free_pages_.end(), id);
}

} // namespace zephyrite::disk
