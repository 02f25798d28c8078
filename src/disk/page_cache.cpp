#include "disk/page_cache.hpp"

#include "storage/error.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace zephyrite::disk {

PageCache::PageCache(PageStore& store, std::size_t capacity)
    : store_(store), capacity_(capacity)
{
    index_.reserve(capacity);
}

void PageCache::write_back(Page& page) {
    if (!page.is_dirty()) return;
    store_.write_page(page);
    page.clear_dirty();
}

void PageCache::evict_one() {
    auto& victim = lru_.back();
    write_back(victim);

    spdlog::debug("Page cache evicting page {}", victim.id());
    index_.erase(victim.id());
    lru_.pop_back();
}

Page* PageCache::get(PageId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        ++misses_;
        return nullptr;
    }

    ++hits_;
    lru_.splice(lru_.begin(), lru_, it->second);
    return &*it->second;
}

Page& PageCache::fetch(PageId id) {
    if (auto* page = get(id)) return *page;

    if (capacity_ == 0) {
        throw StorageError::unsupported("Page cache with capacity 0 cannot hold pages");
    }
    insert(store_.read_page(id));
    return lru_.front();
}

void PageCache::insert(Page page) {
    const auto id = page.id();

    if (auto it = index_.find(id); it != index_.end()) {
        if (it->second->is_dirty()) page.mark_dirty();
        *it->second = std::move(page);
        lru_.splice(lru_.begin(), lru_, it->second);
        return;
    }

    if (capacity_ == 0) {
        write_back(page);
        return;
    }

    while (index_.size() >= capacity_) {
        evict_one();
    }

    lru_.push_front(std::move(page));
    index_.emplace(id, lru_.begin());
}

bool PageCache::mark_dirty(PageId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;
    it->second->mark_dirty();
    return true;
}

std::vector<PageId> PageCache::dirty_pages() const {
    std::vector<PageId> ids;
    for (const auto& page : lru_) {
        if (page.is_dirty()) ids.push_back(page.id());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<Page> PageCache::remove(PageId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;

    write_back(*it->second);

    Page page = std::move(*it->second);
    lru_.erase(it->second);
    index_.erase(it);
    return page;
}

void PageCache::clear() {
    flush_dirty_pages();
    lru_.clear();
    index_.clear();
}

std::vector<PageId> PageCache::flush_dirty_pages() {
    auto ids = dirty_pages();
    for (auto id : ids) {
        write_back(*index_.at(id));
    }
    if (!ids.empty()) {
        spdlog::debug("Page cache flushed {} dirty pages", ids.size());
    }
    return ids;
}

PageCacheStats PageCache::stats() const {
    const auto lookups = hits_ + misses_;
    return {
        .capacity = capacity_,
        .cached_pages = index_.size(),
        .dirty_pages = static_cast<std::size_t>(std::count_if(
            lru_.begin(), lru_.end(), [](const Page& p) { return p.is_dirty(); })),
        .hits = hits_,
        .misses = misses_,
        .hit_ratio = lookups == 0 ? 0.0
                                  : static_cast<double>(hits_) / static_cast<double>(lookups),
    };
}

} // namespace zephyrite::disk
