#pragma once

#include "storage/storage_engine.hpp"
#include "storage/validation.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace zephyrite {

enum class StorageKind : uint8_t {
    Memory,
    Persistent,
};

[[nodiscard]] std::string_view to_string(StorageKind kind) noexcept;

// ── StorageConfig ────────────────────────────────────────────────────────────
//
// Everything needed to build a backend.  `wal_path` is required (non-empty)
// for StorageKind::Persistent and ignored otherwise.

struct StorageConfig {
    StorageKind kind = StorageKind::Memory;
    std::optional<std::size_t> memory_capacity;
    std::string wal_path;
    bool use_checksums = true;
    KeyPolicy key_policy;
};

// Builds the backend described by `config`.  A persistent backend replays its
// WAL before this returns.  Throws StorageError on failure.
[[nodiscard]] std::unique_ptr<StorageEngine> make_storage(const StorageConfig& config);

} // namespace zephyrite
