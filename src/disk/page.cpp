#include "disk/page.hpp"

#include "storage/error.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace zephyrite::disk {

namespace {

void check_range(PageId id, std::size_t offset, std::size_t length, const char* what) {
    // Written as a subtraction so offset + length cannot overflow.
    if (offset > kPageSize || length > kPageSize - offset) {
        throw StorageError::internal(fmt::format(
            "{} out of bounds on page {}: offset {} + length {} exceeds page size {}",
            what, id, offset, length, kPageSize));
    }
}

} // anonymous namespace

Page::Page(PageId id) : id_(id), data_(kPageSize, 0) {}

Page Page::from_data(PageId id, std::span<const uint8_t> data) {
    if (data.size() > kPageSize) {
        throw StorageError::internal(fmt::format(
            "Data for page {} exceeds page size: {} > {}", id, data.size(), kPageSize));
    }

    Page page(id);
    std::copy(data.begin(), data.end(), page.data_.begin());
    return page;
}

void Page::write(std::size_t offset, std::span<const uint8_t> bytes) {
    check_range(id_, offset, bytes.size(), "Write");
    std::copy(bytes.begin(), bytes.end(), data_.begin() + static_cast<std::ptrdiff_t>(offset));
    mark_dirty();
}

std::span<const uint8_t> Page::read(std::size_t offset, std::size_t length) const {
    check_range(id_, offset, length, "Read");
    return std::span<const uint8_t>(data_).subspan(offset, length);
}

} // namespace zephyrite::disk
