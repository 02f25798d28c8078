#include "disk/file_header.hpp"

#include "storage/error.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace zephyrite::disk {

namespace {

constexpr std::size_t kVersionOffset = 9;
constexpr std::size_t kPageSizeOffset = 11;
constexpr std::size_t kNextPageOffset = 13;
constexpr std::size_t kFreeCountOffset = 21;
constexpr std::size_t kIndexPageOffset = 29;

template <typename T>
void put_le(uint8_t* dst, T v) {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        dst[i] = static_cast<uint8_t>((v >> (i * 8)) & 0xFF);
    }
}

template <typename T>
T get_le(const uint8_t* src) {
    T v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        v |= static_cast<T>(static_cast<T>(src[i]) << (i * 8));
    }
    return v;
}

} // anonymous namespace

std::array<uint8_t, kFileHeaderSize> FileHeader::serialize() const {
    std::array<uint8_t, kFileHeaderSize> bytes{};
    std::copy(kFileMagic.begin(), kFileMagic.end(), bytes.begin());
    put_le<uint16_t>(bytes.data() + kVersionOffset, version);
    put_le<uint16_t>(bytes.data() + kPageSizeOffset, page_size);
    put_le<uint64_t>(bytes.data() + kNextPageOffset, next_page);
    put_le<uint64_t>(bytes.data() + kFreeCountOffset, free_pages_count);
    put_le<uint64_t>(bytes.data() + kIndexPageOffset, index_page_id);
    return bytes;
}

FileHeader FileHeader::deserialize(std::span<const uint8_t> bytes) {
    if (bytes.size() < kFileHeaderSize) {
        throw StorageError::internal(fmt::format(
            "Invalid header size: expected {}, got {}", kFileHeaderSize, bytes.size()));
    }
    if (!std::equal(kFileMagic.begin(), kFileMagic.end(), bytes.begin())) {
        throw StorageError::internal("Invalid Zephyrite file identifier");
    }

    FileHeader header{
        .version = get_le<uint16_t>(bytes.data() + kVersionOffset),
        .page_size = get_le<uint16_t>(bytes.data() + kPageSizeOffset),
        .next_page = get_le<uint64_t>(bytes.data() + kNextPageOffset),
        .free_pages_count = get_le<uint64_t>(bytes.data() + kFreeCountOffset),
        .index_page_id = get_le<uint64_t>(bytes.data() + kIndexPageOffset),
    };
    header.validate();
    return header;
}

void FileHeader::validate() const {
    if (version == 0 || version > kFormatVersion) {
        throw StorageError::internal(fmt::format("Unsupported format version: {}", version));
    }
    if (page_size == 0 || (page_size & (page_size - 1)) != 0) {
        throw StorageError::internal(
            fmt::format("Invalid page size: {} (must be power of 2)", page_size));
    }
    if (next_page == 0) {
        throw StorageError::internal("Invalid next_page: cannot be 0");
    }
}

} // namespace zephyrite::disk
