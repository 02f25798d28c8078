#pragma once

#include "disk/page.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace zephyrite::disk {

static constexpr std::string_view kFileMagic = "ZEPHYRITE";
static constexpr uint16_t kFormatVersion = 1;
static constexpr std::size_t kFileHeaderSize = 64;

// ── FileHeader ───────────────────────────────────────────────────────────────
//
// First 64 bytes of page 0.  Little-endian, zero-padded:
//
//   offset  size  field
//   0       9     magic "ZEPHYRITE"
//   9       2     version
//   11      2     page_size
//   13      8     next_page
//   21      8     free_pages_count
//   29      8     index_page_id
//   37      27    zero padding

struct FileHeader {
    uint16_t version = kFormatVersion;
    uint16_t page_size = static_cast<uint16_t>(kPageSize);
    uint64_t next_page = 1;
    uint64_t free_pages_count = 0;
    uint64_t index_page_id = 0;

    [[nodiscard]] std::array<uint8_t, kFileHeaderSize> serialize() const;

    // Parses and validates the first kFileHeaderSize bytes of `bytes`.
    // Throws StorageError (Internal) if `bytes` is too short, the magic does
    // not match, or validate() fails.
    [[nodiscard]] static FileHeader deserialize(std::span<const uint8_t> bytes);

    // Throws StorageError (Internal) unless 1 <= version <= kFormatVersion,
    // page_size is a non-zero power of two and next_page != 0.
    void validate() const;

    bool operator==(const FileHeader&) const = default;
};

} // namespace zephyrite::disk
