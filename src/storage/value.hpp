#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace zephyrite {

// ── ValueMetadata ────────────────────────────────────────────────────────────
//
// Timestamps are ISO-8601 UTC strings (see common/time.hpp), so comparing
// them as strings compares them in time.

struct ValueMetadata {
    std::size_t size = 0;
    std::string created_at;
    std::string updated_at;

    // Metadata for a value written for the first time at `timestamp`.
    [[nodiscard]] static ValueMetadata create(std::size_t size, const std::string& timestamp);

    bool operator==(const ValueMetadata&) const = default;
};

// ── Value ────────────────────────────────────────────────────────────────────
//
// A stored value.  Values are replaced, never mutated in place: an overwrite
// builds a new Value via replaced_by().

struct Value {
    std::string content;
    ValueMetadata metadata;

    // A brand-new value stamped with `timestamp` (both created_at and
    // updated_at).
    [[nodiscard]] static Value create(std::string content, const std::string& timestamp);

    // Same as above, stamped with the current time.
    [[nodiscard]] static Value create(std::string content);

    // The value that replaces *this when `content` is written at `timestamp`.
    // created_at is carried over; size and updated_at are refreshed.
    [[nodiscard]] Value replaced_by(std::string content, const std::string& timestamp) const;

    bool operator==(const Value&) const = default;
};

// ── Stats ────────────────────────────────────────────────────────────────────

struct Stats {
    std::size_t key_count = 0;
    std::size_t memory_usage = 0;   // estimate, see MemoryStorage::memory_usage()
    uint64_t get_operations_count = 0;
    uint64_t put_operations_count = 0;
    uint64_t delete_operations_count = 0;

    bool operator==(const Stats&) const = default;
};

} // namespace zephyrite
