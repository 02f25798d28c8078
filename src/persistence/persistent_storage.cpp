#include "persistence/persistent_storage.hpp"

#include "storage/error.hpp"
#include "storage/validation.hpp"

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace zephyrite::persistence {

PersistentStorage::PersistentStorage(std::filesystem::path wal_path,
                                     bool use_checksums,
                                     std::size_t initial_capacity,
                                     KeyPolicy policy)
    : memory_(initial_capacity, policy)
    , wal_(std::move(wal_path), use_checksums)
{
    recover();
}

// ── Recovery ─────────────────────────────────────────────────────────────────

void PersistentStorage::recover() {
    spdlog::info("Starting WAL recovery from {}", wal_.path().string());

    auto entries = wal_.read_all_entries();
    recovery_.entries_read = entries.size();

    if (entries.empty()) {
        spdlog::info("No WAL entries found, starting with empty storage");
        return;
    }

    for (const auto& entry : entries) {
        try {
            std::visit([&](const auto& op) {
                using T = std::decay_t<decltype(op)>;
                if constexpr (std::is_same_v<T, PutOp>) {
                    memory_.put_at(op.key, op.value, entry.timestamp);
                } else if constexpr (std::is_same_v<T, DeleteOp>) {
                    memory_.del(op.key);
                } else {
                    memory_.clear();
                }
            }, entry.operation);
            ++recovery_.recovered;
            spdlog::debug("Recovered {} (seq {})",
                          operation_name(entry.operation), entry.sequence_number);
        } catch (const StorageError& e) {
            ++recovery_.failed;
            spdlog::warn("Failed to recover {} (seq {}): {}",
                         operation_name(entry.operation), entry.sequence_number, e.what());
        }
    }

    if (recovery_.failed > 0) {
        spdlog::warn("WAL recovery completed with {} failed operations out of {} total",
                     recovery_.failed, entries.size());
    } else {
        spdlog::info("WAL recovery completed: {} operations recovered", recovery_.recovered);
    }
}

// ── Mutations ────────────────────────────────────────────────────────────────

bool PersistentStorage::put(std::string_view key, std::string_view value) {
    validate_key(key, memory_.key_policy());
    validate_value(value);

    std::lock_guard lock(write_mutex_);
    auto entry = wal_.log_operation(PutOp{std::string(key), std::string(value)});
    return memory_.put_at(key, value, entry.timestamp);
}

bool PersistentStorage::del(std::string_view key) {
    validate_key(key, memory_.key_policy());

    std::lock_guard lock(write_mutex_);
    wal_.log_operation(DeleteOp{std::string(key)});
    return memory_.del(key);
}

void PersistentStorage::clear() {
    std::lock_guard lock(write_mutex_);
    wal_.log_operation(ClearOp{});
    memory_.clear();
}

// ── Reads ────────────────────────────────────────────────────────────────────

Value PersistentStorage::get(std::string_view key) const { return memory_.get(key); }

bool PersistentStorage::exists(std::string_view key) const { return memory_.exists(key); }

std::vector<std::string> PersistentStorage::keys() const { return memory_.keys(); }

std::vector<Value> PersistentStorage::values() const { return memory_.values(); }

std::unordered_map<std::string, Value> PersistentStorage::all() const { return memory_.all(); }

Stats PersistentStorage::stats() const { return memory_.stats(); }

std::size_t PersistentStorage::size_of_value(std::string_view key) const {
    return memory_.size_of_value(key);
}

// ── Compaction ───────────────────────────────────────────────────────────────

CompactionResult PersistentStorage::compact() {
    std::lock_guard lock(write_mutex_);
    spdlog::info("Starting WAL compaction of {}", wal_.path().string());

    auto snapshot = memory_.all();
    const auto entries_before = wal_.read_all_entries().size();

    std::vector<std::pair<std::string, Value>> live(
        std::make_move_iterator(snapshot.begin()),
        std::make_move_iterator(snapshot.end()));
    std::sort(live.begin(), live.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<WalOperation> ops;
    ops.reserve(live.size());
    for (auto& [key, value] : live) {
        ops.emplace_back(PutOp{key, std::move(value.content)});
    }

    const auto entries_after = wal_.rewrite(ops);

    spdlog::info("WAL compaction completed: {} entries before, {} entries after",
                 entries_before, entries_after);
    return {.entries_before = entries_before, .entries_after = entries_after};
}

DetailedStats PersistentStorage::detailed_stats() const {
    return {
        .memory_stats = memory_.stats(),
        .wal_file_path = wal_.path().string(),
        .wal_sequence_number = wal_.current_sequence_number(),
    };
}

} // namespace zephyrite::persistence
