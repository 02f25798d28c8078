#pragma once

#include "storage/value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace zephyrite {

// ── StorageEngine ────────────────────────────────────────────────────────────
//
// Abstract interface for a key-value storage backend.  The concrete backend
// (MemoryStorage or PersistentStorage) is selected from configuration by
// make_storage().
//
// Implementations must be thread-safe: multiple concurrent readers are
// allowed, writers are exclusive.
//
// Every operation reports failure by throwing StorageError.  Operations that
// take a key (and value) validate them first; a validation failure is thrown
// before any state changes.

class StorageEngine {
public:
    virtual ~StorageEngine() = default;

    // Inserts or overwrites `key`.  Returns true if the key was absent.
    virtual bool put(std::string_view key, std::string_view value) = 0;

    // Returns the stored value; throws KeyNotFound if absent.
    [[nodiscard]] virtual Value get(std::string_view key) const = 0;

    // Removes `key`.  Returns true if the key existed, false otherwise.
    virtual bool del(std::string_view key) = 0;

    [[nodiscard]] virtual bool exists(std::string_view key) const = 0;

    // Returns all keys (order is unspecified).
    [[nodiscard]] virtual std::vector<std::string> keys() const = 0;

    [[nodiscard]] virtual std::vector<Value> values() const = 0;

    // Point-in-time copy of the whole store.  Not transactionally consistent
    // with writers running concurrently on other threads.
    [[nodiscard]] virtual std::unordered_map<std::string, Value> all() const = 0;

    // Removes all entries.
    virtual void clear() = 0;

    [[nodiscard]] virtual Stats stats() const = 0;

    // Size in bytes of the value stored under `key`; throws KeyNotFound if
    // absent.
    [[nodiscard]] virtual std::size_t size_of_value(std::string_view key) const = 0;
};

} // namespace zephyrite
