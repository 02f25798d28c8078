#include "storage/storage_factory.hpp"

#include "persistence/persistent_storage.hpp"
#include "storage/error.hpp"
#include "storage/memory_storage.hpp"

#include <spdlog/spdlog.h>

namespace zephyrite {

std::string_view to_string(StorageKind kind) noexcept {
    switch (kind) {
        case StorageKind::Memory:     return "memory";
        case StorageKind::Persistent: return "persistent";
    }
    return "unknown";
}

std::unique_ptr<StorageEngine> make_storage(const StorageConfig& config) {
    const auto capacity = config.memory_capacity.value_or(0);

    switch (config.kind) {
        case StorageKind::Memory:
            spdlog::info("Using in-memory storage (capacity hint {})", capacity);
            return std::make_unique<MemoryStorage>(capacity, config.key_policy);

        case StorageKind::Persistent:
            if (config.wal_path.empty()) {
                throw StorageError::internal("Persistent storage requires a WAL path");
            }
            spdlog::info("Using persistent storage with WAL at {} (checksums {})",
                         config.wal_path, config.use_checksums ? "on" : "off");
            return std::make_unique<persistence::PersistentStorage>(
                config.wal_path, config.use_checksums, capacity, config.key_policy);
    }

    throw StorageError::unsupported("Unknown storage kind");
}

} // namespace zephyrite
