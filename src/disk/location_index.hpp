#pragma once

#include "disk/page.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace zephyrite::disk {

// Where a value lives on disk: `size` bytes at `offset` within page `page_id`.
struct IndexEntry {
    std::string key;
    PageId page_id = 0;
    uint16_t offset = 0;
    uint16_t size = 0;

    // offset + size, saturating at UINT16_MAX.
    [[nodiscard]] uint16_t end_offset() const noexcept;

    // True if both entries sit on the same page and their byte ranges
    // intersect.  Adjacent ranges do not overlap.
    [[nodiscard]] bool overlaps_with(const IndexEntry& other) const noexcept;

    bool operator==(const IndexEntry&) const = default;
};

struct IndexStats {
    std::size_t entry_count = 0;
    std::size_t page_count = 0;
    std::size_t total_data_size = 0;
    double average_key_length = 0.0;
    double average_value_size = 0.0;
    uint16_t max_value_size = 0;
    uint16_t min_value_size = 0;
    double average_entries_per_page = 0.0;
};

// ── LocationIndex ────────────────────────────────────────────────────────────
//
// key → IndexEntry.  Entries are bounds-checked against the page size on
// insert; overlap between entries is only reported by validate().
// Not thread-safe.

class LocationIndex {
public:
    explicit LocationIndex(std::size_t initial_capacity = 0);

    // Inserts or replaces the entry for entry.key and returns the previous one.
    // Throws StorageError (Internal) if the entry targets page 0 or extends
    // past the end of its page.
    std::optional<IndexEntry> insert(IndexEntry entry);

    [[nodiscard]] const IndexEntry* find(std::string_view key) const;

    std::optional<IndexEntry> remove(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] std::vector<std::string> keys() const;

    // Entries stored on `page_id`, ordered by offset.
    [[nodiscard]] std::vector<IndexEntry> entries_on_page(PageId page_id) const;

    // Distinct pages referenced by any entry, ascending.
    [[nodiscard]] std::vector<PageId> used_pages() const;

    [[nodiscard]] IndexStats stats() const;

    // One message per pair of overlapping entries, e.g.
    //   "Overlapping entries on page 3: a and b"
    // Empty if the index is consistent.
    [[nodiscard]] std::vector<std::string> validate() const;

private:
    std::unordered_map<std::string, IndexEntry> entries_;
};

} // namespace zephyrite::disk
