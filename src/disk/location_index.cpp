#include "disk/location_index.hpp"

#include "storage/error.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <tuple>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

namespace zephyrite::disk {

// ── IndexEntry ───────────────────────────────────────────────────────────────

uint16_t IndexEntry::end_offset() const noexcept {
    const uint32_t end = uint32_t{offset} + uint32_t{size};
    return static_cast<uint16_t>(std::min<uint32_t>(end, std::numeric_limits<uint16_t>::max()));
}

bool IndexEntry::overlaps_with(const IndexEntry& other) const noexcept {
    if (page_id != other.page_id) return false;
    return !(end_offset() <= other.offset || other.end_offset() <= offset);
}

// ── LocationIndex ────────────────────────────────────────────────────────────

LocationIndex::LocationIndex(std::size_t initial_capacity) {
    if (initial_capacity > 0) entries_.reserve(initial_capacity);
}

std::optional<IndexEntry> LocationIndex::insert(IndexEntry entry) {
    if (entry.page_id == kHeaderPageId) {
        throw StorageError::internal(
            fmt::format("Index entry for '{}' cannot point at page 0", entry.key));
    }
    if (std::size_t{entry.offset} + std::size_t{entry.size} > kPageSize) {
        throw StorageError::internal(fmt::format(
            "Index entry for '{}' exceeds page bounds: offset {} + size {} > {}",
            entry.key, entry.offset, entry.size, kPageSize));
    }

    auto [it, inserted] = entries_.try_emplace(entry.key, entry);
    if (inserted) return std::nullopt;

    auto previous = std::exchange(it->second, std::move(entry));
    return previous;
}

const IndexEntry* LocationIndex::find(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<IndexEntry> LocationIndex::remove(std::string_view key) {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) return std::nullopt;

    IndexEntry entry = std::move(it->second);
    entries_.erase(it);
    return entry;
}

bool LocationIndex::contains(std::string_view key) const {
    return entries_.contains(std::string(key));
}

std::vector<std::string> LocationIndex::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, _] : entries_) {
        result.push_back(key);
    }
    return result;
}

std::vector<IndexEntry> LocationIndex::entries_on_page(PageId page_id) const {
    std::vector<IndexEntry> result;
    for (const auto& [_, entry] : entries_) {
        if (entry.page_id == page_id) result.push_back(entry);
    }
    std::sort(result.begin(), result.end(), [](const IndexEntry& a, const IndexEntry& b) {
        return a.offset < b.offset;
    });
    return result;
}

std::vector<PageId> LocationIndex::used_pages() const {
    std::vector<PageId> pages;
    pages.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
        pages.push_back(entry.page_id);
    }
    std::sort(pages.begin(), pages.end());
    pages.erase(std::unique(pages.begin(), pages.end()), pages.end());
    return pages;
}

IndexStats LocationIndex::stats() const {
    if (entries_.empty()) return {};

    std::unordered_set<PageId> pages;
    std::size_t total_key_length = 0;
    std::size_t total_data_size = 0;
    uint16_t min_size = std::numeric_limits<uint16_t>::max();
    uint16_t max_size = 0;

    for (const auto& [key, entry] : entries_) {
        pages.insert(entry.page_id);
        total_key_length += key.size();
        total_data_size += entry.size;
        min_size = std::min(min_size, entry.size);
        max_size = std::max(max_size, entry.size);
    }

    const auto n = static_cast<double>(entries_.size());
    return {
        .entry_count = entries_.size(),
        .page_count = pages.size(),
        .total_data_size = total_data_size,
        .average_key_length = static_cast<double>(total_key_length) / n,
        .average_value_size = static_cast<double>(total_data_size) / n,
        .max_value_size = max_size,
        .min_value_size = min_size,
        .average_entries_per_page = n / static_cast<double>(pages.size()),
    };
}

std::vector<std::string> LocationIndex::validate() const {
    // Ordered by page id so the report is deterministic.
    std::map<PageId, std::vector<const IndexEntry*>> by_page;
    for (const auto& [_, entry] : entries_) {
        by_page[entry.page_id].push_back(&entry);
    }

    std::vector<std::string> errors;
    for (auto& [page_id, page_entries] : by_page) {
        std::sort(page_entries.begin(), page_entries.end(),
                  [](const IndexEntry* a, const IndexEntry* b) {
                      return std::tie(a->offset, a->key) < std::tie(b->offset, b->key);
                  });

        for (std::size_t i = 0; i < page_entries.size(); ++i) {
            for (std::size_t j = i + 1; j < page_entries.size(); ++j) {
                if (page_entries[i]->overlaps_with(*page_entries[j])) {
                    errors.push_back(fmt::format("Overlapping entries on page {}: {} and {}",
                                                 page_id, page_entries[i]->key,
                                                 page_entries[j]->key));
                }
            }
        }
    }
    return errors;
}

} // namespace zephyrite::disk
