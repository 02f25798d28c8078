#include "disk/page_file.hpp"

#include "storage/error.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace zephyrite::disk {

namespace {

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

[[noreturn]] void fail(std::string_view what, const std::filesystem::path& path,
                       const std::error_code& ec) {
    throw StorageError::internal(
        fmt::format("{} '{}': {}", what, path.string(), ec.message()));
}

off_t page_offset(PageId id) {
    return static_cast<off_t>(id * kPageSize);
}

// Reads up to `len` bytes at `offset`.  Stops early at end of file.
std::error_code pread_all(int fd, uint8_t* buf, std::size_t len, off_t offset,
                          std::size_t& read_out) {
    read_out = 0;
    while (read_out < len) {
        auto n = ::pread(fd, buf + read_out, len - read_out,
                         offset + static_cast<off_t>(read_out));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        if (n == 0) break;
        read_out += static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code pwrite_all(int fd, const uint8_t* buf, std::size_t len, off_t offset) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::pwrite(fd, buf + written, len - written,
                          offset + static_cast<off_t>(written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

void write_u64_le(uint8_t* dst, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        dst[i] = static_cast<uint8_t>((v >> (i * 8)) & 0xFF);
    }
}

uint64_t read_u64_le(const uint8_t* src) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(src[i]) << (i * 8);
    }
    return v;
}

} // anonymous namespace

PageFile::PageFile(Token, std::filesystem::path path, int fd, FileHeader header,
                   PageAllocator allocator)
    : path_(std::move(path))
    , fd_(fd)
    , header_(header)
    , allocator_(std::move(allocator))
{}

std::unique_ptr<PageFile> PageFile::create(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) fail("Failed to create page file", path, make_errno_error());

    auto file = std::make_unique<PageFile>(Token{}, path, fd, FileHeader{}, PageAllocator{});
    file->sync();
    spdlog::debug("Created page file {}", path.string());
    return file;
}

std::unique_ptr<PageFile> PageFile::open(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) fail("Failed to open page file", path, make_errno_error());

    std::vector<uint8_t> page0(kPageSize, 0);
    std::size_t n = 0;
    if (auto ec = pread_all(fd, page0.data(), page0.size(), 0, n)) {
        ::close(fd);
        fail("Failed to read header of page file", path, ec);
    }

    FileHeader header;
    PageAllocator allocator;
    try {
        header = FileHeader::deserialize(std::span<const uint8_t>(page0.data(), n));
        if (header.page_size != kPageSize) {
            throw StorageError::internal(fmt::format(
                "Unsupported page size {} (expected {})", header.page_size, kPageSize));
        }
        if (header.free_pages_count > kMaxPersistedFreePages) {
            throw StorageError::internal(fmt::format(
                "Free page count {} exceeds maximum {}",
                header.free_pages_count, kMaxPersistedFreePages));
        }

        std::vector<PageId> free_ids;
        free_ids.reserve(header.free_pages_count);
        for (uint64_t i = 0; i < header.free_pages_count; ++i) {
            free_ids.push_back(read_u64_le(page0.data() + kFileHeaderSize + i * sizeof(PageId)));
        }
        allocator = PageAllocator(header.next_page, std::move(free_ids));
    } catch (const StorageError&) {
        ::close(fd);
        throw;
    }

    spdlog::debug("Opened page file {} (next page {}, {} free)",
                  path.string(), header.next_page, header.free_pages_count);
    return std::make_unique<PageFile>(Token{}, path, fd, header, std::move(allocator));
}

PageFile::~PageFile() {
    try {
        sync();
    } catch (const StorageError& e) {
        spdlog::error("Failed to sync page file on close: {}", e.what());
    }
    ::close(fd_);
}

void PageFile::check_allocated(PageId id) const {
    if (id == kHeaderPageId) {
        throw StorageError::internal("Page 0 is reserved for the file header");
    }
    if (id >= allocator_.next_page_id() || allocator_.is_free(id)) {
        throw StorageError::internal(fmt::format("Page {} is not allocated", id));
    }
}

Page PageFile::read_page(PageId id) {
    check_allocated(id);

    std::vector<uint8_t> buf(kPageSize, 0);
    std::size_t n = 0;
    if (auto ec = pread_all(fd_, buf.data(), buf.size(), page_offset(id), n)) {
        fail(fmt::format("Failed to read page {} of", id), path_, ec);
    }
    return Page::from_data(id, std::span<const uint8_t>(buf.data(), n));
}

void PageFile::write_page(const Page& page) {
    check_allocated(page.id());

    auto data = page.data();
    if (auto ec = pwrite_all(fd_, data.data(), data.size(), page_offset(page.id()))) {
        fail(fmt::format("Failed to write page {} of", page.id()), path_, ec);
    }
}

PageId PageFile::allocate_page() {
    return allocator_.allocate();
}

void PageFile::free_page(PageId id) {
    allocator_.free(id);
}

void PageFile::sync() {
    const auto& free_ids = allocator_.free_pages();

    // Ids are popped from the back, so the largest ones are kept.
    std::size_t persisted = std::min(free_ids.size(), kMaxPersistedFreePages);
    if (persisted < free_ids.size()) {
        spdlog::warn("Page file {}: {} free pages do not fit in the header page and are leaked",
                     path_.string(), free_ids.size() - persisted);
    }

    header_.next_page = allocator_.next_page_id();
    header_.free_pages_count = persisted;

    std::vector<uint8_t> page0(kPageSize, 0);
    auto hdr = header_.serialize();
    std::copy(hdr.begin(), hdr.end(), page0.begin());
    auto first = free_ids.end() - static_cast<std::ptrdiff_t>(persisted);
    std::size_t slot = 0;
    for (auto it = first; it != free_ids.end(); ++it, ++slot) {
        write_u64_le(page0.data() + kFileHeaderSize + slot * sizeof(PageId), *it);
    }

    if (auto ec = pwrite_all(fd_, page0.data(), page0.size(), 0)) {
        fail("Failed to write header of page file", path_, ec);
    }
    if (::fsync(fd_) < 0) {
        fail("Failed to sync page file", path_, make_errno_error());
    }
}

} // namespace zephyrite::disk
