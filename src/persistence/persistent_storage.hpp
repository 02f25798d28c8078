#pragma once

#include "persistence/wal.hpp"
#include "storage/memory_storage.hpp"
#include "storage/storage_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace zephyrite::persistence {

struct RecoveryStats {
    std::size_t entries_read = 0;
    std::size_t recovered = 0;
    std::size_t failed = 0;
};

struct CompactionResult {
    std::size_t entries_before = 0;
    std::size_t entries_after = 0;

    bool operator==(const CompactionResult&) const = default;
};

struct DetailedStats {
    Stats memory_stats;
    std::string wal_file_path;
    uint64_t wal_sequence_number = 0;
};

// ── PersistentStorage ────────────────────────────────────────────────────────
//
// A MemoryStorage made durable by a WalManager.
//
//   write: validate → append to WAL (fdatasync) → apply to memory
//   read:  memory only
//   open:  replay the whole WAL into an empty map
//
// Mutations and compaction are serialised by write_mutex_, so the order in
// which operations reach memory is the order in which they appear in the log.
// Reads never take write_mutex_.

class PersistentStorage final : public StorageEngine {
public:
    // Opens (or creates) the log at `wal_path` and replays it.  Throws
    // StorageError (Internal) if the log cannot be opened, read or verified.
    explicit PersistentStorage(std::filesystem::path wal_path,
                               bool use_checksums = true,
                               std::size_t initial_capacity = 0,
                               KeyPolicy policy = {});

    PersistentStorage(const PersistentStorage&)            = delete;
    PersistentStorage& operator=(const PersistentStorage&) = delete;

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

    // Rewrites the log as one Put per live key, sorted by key.
    CompactionResult compact();

    [[nodiscard]] DetailedStats detailed_stats() const;

    // Outcome of the replay performed by the constructor.
    [[nodiscard]] const RecoveryStats& recovery_stats() const noexcept { return recovery_; }

    [[nodiscard]] const std::filesystem::path& wal_path() const noexcept { return wal_.path(); }

private:
    void recover();

    MemoryStorage memory_;
    WalManager wal_;
    RecoveryStats recovery_;

    std::mutex write_mutex_;
};

} // namespace zephyrite::persistence
