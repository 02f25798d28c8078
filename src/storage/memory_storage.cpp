#include "storage/memory_storage.hpp"

#include "common/time.hpp"
#include "storage/error.hpp"

#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace zephyrite {

MemoryStorage::MemoryStorage(std::size_t initial_capacity, KeyPolicy policy)
    : policy_(policy)
{
    if (initial_capacity > 0) {
        map_.reserve(initial_capacity);
    }
}

// A failing lock primitive surfaces as an Internal error rather than
// terminating the process.
std::shared_lock<std::shared_mutex> MemoryStorage::read_lock() const {
    try {
        return std::shared_lock<std::shared_mutex>(mutex_);
    } catch (const std::system_error& e) {
        throw StorageError::internal(
            fmt::format("Failed to acquire read lock: {}", e.what()));
    }
}

std::unique_lock<std::shared_mutex> MemoryStorage::write_lock() {
    try {
        return std::unique_lock<std::shared_mutex>(mutex_);
    } catch (const std::system_error& e) {
        throw StorageError::internal(
            fmt::format("Failed to acquire write lock: {}", e.what()));
    }
}

bool MemoryStorage::put(std::string_view key, std::string_view value) {
    return put_at(key, value, current_timestamp());
}

bool MemoryStorage::put_at(std::string_view key, std::string_view value,
                           const std::string& timestamp) {
    validate_key(key, policy_);
    validate_value(value);

    auto lock = write_lock();

    // std::unordered_map supports heterogeneous lookup via find(string_view)
    // only with a transparent hash; the key is materialised once here.
    std::string owned_key(key);
    auto it = map_.find(owned_key);
    const bool created = (it == map_.end());
    if (created) {
        map_.emplace(std::move(owned_key), Value::create(std::string(value), timestamp));
    } else {
        it->second = it->second.replaced_by(std::string(value), timestamp);
    }

    put_ops_.fetch_add(1, std::memory_order_relaxed);
    return created;
}

Value MemoryStorage::get(std::string_view key) const {
    validate_key(key, policy_);

    auto lock = read_lock();
    get_ops_.fetch_add(1, std::memory_order_relaxed);

    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        throw StorageError::key_not_found(key);
    }
    return it->second;
}

bool MemoryStorage::del(std::string_view key) {
    validate_key(key, policy_);

    auto lock = write_lock();
    delete_ops_.fetch_add(1, std::memory_order_relaxed);
    return map_.erase(std::string(key)) > 0;
}

bool MemoryStorage::exists(std::string_view key) const {
    validate_key(key, policy_);

    auto lock = read_lock();
    return map_.contains(std::string(key));
}

std::vector<std::string> MemoryStorage::keys() const {
    auto lock = read_lock();
    std::vector<std::string> result;
    result.reserve(map_.size());
    for (const auto& [k, _] : map_) {
        result.push_back(k);
    }
    return result;
}

std::vector<Value> MemoryStorage::values() const {
    auto lock = read_lock();
    std::vector<Value> result;
    result.reserve(map_.size());
    for (const auto& [_, v] : map_) {
        result.push_back(v);
    }
    return result;
}

std::unordered_map<std::string, Value> MemoryStorage::all() const {
    auto lock = read_lock();
    return map_; // full copy under read lock
}

void MemoryStorage::clear() {
    auto lock = write_lock();
    map_.clear();
}

Stats MemoryStorage::stats() const {
    auto lock = read_lock();
    return Stats{
        .key_count = map_.size(),
        .memory_usage = memory_usage(map_),
        .get_operations_count = get_ops_.load(std::memory_order_relaxed),
        .put_operations_count = put_ops_.load(std::memory_order_relaxed),
        .delete_operations_count = delete_ops_.load(std::memory_order_relaxed),
    };
}

std::size_t MemoryStorage::size_of_value(std::string_view key) const {
    validate_key(key, policy_);

    auto lock = read_lock();
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        throw StorageError::key_not_found(key);
    }
    return it->second.metadata.size;
}

std::size_t MemoryStorage::memory_usage(
    const std::unordered_map<std::string, Value>& data) noexcept {
    std::size_t total = 0;
    for (const auto& [k, v] : data) {
        total += k.size() + v.content.size() + sizeof(Value);
    }
    return total;
}

} // namespace zephyrite
