#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <sys/types.h>

namespace zephyrite::persistence {

// ── WAL operations ───────────────────────────────────────────────────────────
//
// Each logged mutation is a plain struct; WalOperation wraps them in a
// std::variant so callers can std::visit over it without inheritance.

struct PutOp {
    std::string key;
    std::string value;

    bool operator==(const PutOp&) const = default;
};

struct DeleteOp {
    std::string key;

    bool operator==(const DeleteOp&) const = default;
};

struct ClearOp {
    bool operator==(const ClearOp&) const = default;
};

using WalOperation = std::variant<PutOp, DeleteOp, ClearOp>;

// Lower-case operation name ("put", "delete", "clear") for logging.
[[nodiscard]] std::string_view operation_name(const WalOperation& op) noexcept;

// ── WalEntry ─────────────────────────────────────────────────────────────────
//
// One line of the log.  Record format (single-line JSON, '\n' terminated):
//
//   {"sequence_number":7,
//    "operation":{"Put":{"key":"k","value":"v"}} | {"Delete":{"key":"k"}} | "Clear",
//    "timestamp":"2025-01-01T00:00:00.000Z",
//    "checksum":"89abcdef" | null}
//
// The checksum is the CRC-32 of the sequence number, operation and timestamp
// rendered as 8 lower-case hex digits.

struct WalEntry {
    uint64_t sequence_number = 0;
    WalOperation operation;
    std::string timestamp;
    std::optional<std::string> checksum;

    // Builds an entry; attaches a checksum when `with_checksum` is set.
    [[nodiscard]] static WalEntry create(uint64_t sequence_number,
                                         WalOperation operation,
                                         std::string timestamp,
                                         bool with_checksum);

    // Recomputes the checksum over the current content.
    [[nodiscard]] std::string compute_checksum() const;

    // True if there is no checksum or it matches the content.
    [[nodiscard]] bool verify_checksum() const;

    // Serialise to a single JSON line (no trailing newline).
    // Throws StorageError (Internal) if the entry cannot be encoded.
    [[nodiscard]] std::string to_json() const;

    // Parse one JSON line.  Throws StorageError (Internal) on malformed input.
    [[nodiscard]] static WalEntry from_json(std::string_view line);

    bool operator==(const WalEntry&) const = default;
};

// ── CRC32 utility ────────────────────────────────────────────────────────────

// Compute CRC32 (ISO 3309 / ITU-T V.42, same polynomial as zlib).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// ── WalManager ───────────────────────────────────────────────────────────────
//
// Append-only text log.  Every append is written with a single write() and
// fdatasync'ed before log_operation() returns.
//
// Thread-safety: all methods are safe to call concurrently.  One mutex guards
// both the sequence counter and the file descriptor, so sequence assignment
// and the corresponding file write form a single critical section.

class WalManager {
public:
    // Opens (or creates) the log at `path` for appending.  Parent directories
    // are created as needed.  Throws StorageError (Internal) on failure.
    explicit WalManager(std::filesystem::path path, bool use_checksums = true);
    ~WalManager();

    // Non-copyable, non-movable.
    WalManager(const WalManager&) = delete;
    WalManager& operator=(const WalManager&) = delete;
    WalManager(WalManager&&) = delete;
    WalManager& operator=(WalManager&&) = delete;

    // Append `op` with the next sequence number and return the durable entry.
    // On failure throws StorageError (Internal), the sequence counter is left
    // unchanged and the file is cut back to its size before the append.  If
    // that cut fails too the log is closed and every later append throws.
    WalEntry log_operation(WalOperation op);

    // Read and verify every record in file order.  A checksum mismatch, an
    // unparsable line or a non-increasing sequence number fails the whole
    // read.  An unterminated final line is the remnant of an append that never
    // completed; it is skipped with a warning and truncated from the file so
    // the next append starts on a clean line.
    // On success the sequence counter is advanced to the highest sequence
    // number read.
    [[nodiscard]] std::vector<WalEntry> read_all_entries();

    // Reset the log to zero length and the sequence counter to 0.
    void truncate();

    // Atomically replace the log with `ops`, numbered from 1.  The new log is
    // written to "<path>.tmp", synced, then renamed over the live file.
    // Returns the number of records written.
    std::size_t rewrite(const std::vector<WalOperation>& ops);

    [[nodiscard]] uint64_t current_sequence_number() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] bool use_checksums() const noexcept { return use_checksums_; }

    [[nodiscard]] bool is_open() const;

private:
    // Opens path_ for appending.  Caller holds mutex_.
    void open_locked();

    // Closes fd_ if open.  Caller holds mutex_.
    void close_locked() noexcept;

    // Cuts the file to `size` bytes and syncs.  Caller holds mutex_.
    void trim_tail_locked(std::size_t size);

    // Undoes a failed append; closes fd_ if the file cannot be restored.
    // Caller holds mutex_.
    void rollback_locked(off_t size) noexcept;

    std::filesystem::path path_;
    bool use_checksums_;

    mutable std::mutex mutex_;
    int fd_ = -1;
    uint64_t sequence_number_ = 0;
};

} // namespace zephyrite::persistence
