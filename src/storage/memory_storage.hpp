#pragma once

#include "storage/storage_engine.hpp"
#include "storage/validation.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace zephyrite {

// ── MemoryStorage ────────────────────────────────────────────────────────────
//
// Volatile key-value store backed by std::unordered_map.
//
// Concurrency model:
//   - get() / exists() / keys() / values() / all() / stats() /
//     size_of_value() acquire a shared (read) lock.
//   - put() / del() / clear() acquire an exclusive (write) lock.
//   The get/put/delete counters are relaxed atomics: they are observational
//   and not ordered with the map mutation they count.
//
// An overwrite keeps the original created_at and refreshes updated_at.

class MemoryStorage final : public StorageEngine {
public:
    // `initial_capacity` reserves hash buckets up front; 0 means no hint.
    explicit MemoryStorage(std::size_t initial_capacity = 0, KeyPolicy policy = {});

    // Not copyable – copies of a live store would silently race.
    MemoryStorage(const MemoryStorage&)            = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    bool put(std::string_view key, std::string_view value) override;
    [[nodiscard]] Value get(std::string_view key) const override;
    bool del(std::string_view key) override;
    [[nodiscard]] bool exists(std::string_view key) const override;
    [[nodiscard]] std::vector<std::string> keys() const override;
    [[nodiscard]] std::vector<Value> values() const override;
    [[nodiscard]] std::unordered_map<std::string, Value> all() const override;
    void clear() override;
    [[nodiscard]] Stats stats() const override;
    [[nodiscard]] std::size_t size_of_value(std::string_view key) const override;

    // put() with an explicit write time.  PersistentStorage passes the WAL
    // entry's timestamp here so replay reproduces the original metadata.
    bool put_at(std::string_view key, std::string_view value, const std::string& timestamp);

    [[nodiscard]] const KeyPolicy& key_policy() const noexcept { return policy_; }

    // Σ (key bytes + value bytes + sizeof(Value)) over `data`.  An estimate,
    // not allocator accounting.
    [[nodiscard]] static std::size_t memory_usage(
        const std::unordered_map<std::string, Value>& data) noexcept;

private:
    [[nodiscard]] std::shared_lock<std::shared_mutex> read_lock() const;
    [[nodiscard]] std::unique_lock<std::shared_mutex> write_lock();

    KeyPolicy policy_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Value> map_;

    mutable std::atomic<uint64_t> get_ops_{0};
    std::atomic<uint64_t> put_ops_{0};
    std::atomic<uint64_t> delete_ops_{0};
};

} // namespace zephyrite
