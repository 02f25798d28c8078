#include "persistence/wal.hpp"

#include "common/time.hpp"
#include "storage/error.hpp"

#include <array>
#include <cerrno>
#include <system_error>
#include <type_traits>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace zephyrite::persistence {

using json = nlohmann::ordered_json;

// ── CRC32 (ISO 3309 polynomial 0xEDB88320) ──────────────────────────────────

namespace {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1)
                crc = (crc >> 1) ^ 0xEDB88320;
            else
                crc >>= 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32Table = make_crc32_table();

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (std::size_t i = 0; i < length; ++i) {
        crc = kCrc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

// ── Helpers ──────────────────────────────────────────────────────────────────

namespace {

constexpr uint8_t kOpTagPut = 0;
constexpr uint8_t kOpTagDelete = 1;
constexpr uint8_t kOpTagClear = 2;

void write_u32_le(std::vector<uint8_t>& buf, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

void write_u64_le(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

// Length-prefixed so that ("ab","c") and ("a","bc") hash differently.
void write_string(std::vector<uint8_t>& buf, std::string_view s) {
    write_u32_le(buf, static_cast<uint32_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

std::error_code make_errno_error() {
    return {errno, std::system_category()};
}

std::error_code write_bytes(int fd, const std::string& data) {
    const char* ptr = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        auto n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_errno_error();
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
    }

    if (::fdatasync(fd) < 0) {
        return make_errno_error();
    }

    return {};
}

// Read all bytes from `path` into `out`.
std::error_code read_file(const std::filesystem::path& path, std::string& out) {
    out.clear();

    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return make_errno_error();
    }

    char buf[8192];
    while (true) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = make_errno_error();
            ::close(fd);
            return ec;
        }
        if (n == 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }

    ::close(fd);
    return {};
}

[[noreturn]] void fail(std::string_view what, const std::filesystem::path& path,
                       const std::error_code& ec) {
    throw StorageError::internal(
        fmt::format("{} '{}': {}", what, path.string(), ec.message()));
}

json operation_to_json(const WalOperation& op) {
    return std::visit([](const auto& o) -> json {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, PutOp>) {
            return json{{"Put", json{{"key", o.key}, {"value", o.value}}}};
        } else if constexpr (std::is_same_v<T, DeleteOp>) {
            return json{{"Delete", json{{"key", o.key}}}};
        } else {
            return json("Clear");
        }
    }, op);
}

WalOperation operation_from_json(const json& j) {
    if (j.is_string()) {
        if (j.get<std::string>() == "Clear") return ClearOp{};
        throw StorageError::internal(
            fmt::format("Unknown WAL operation '{}'", j.get<std::string>()));
    }
    if (!j.is_object() || j.size() != 1) {
        throw StorageError::internal("Malformed WAL operation");
    }

    if (auto it = j.find("Put"); it != j.end()) {
        return PutOp{it->at("key").get<std::string>(),
                     it->at("value").get<std::string>()};
    }
    if (auto it = j.find("Delete"); it != j.end()) {
        return DeleteOp{it->at("key").get<std::string>()};
    }
    throw StorageError::internal(
        fmt::format("Unknown WAL operation '{}'", j.begin().key()));
}

} // anonymous namespace

std::string_view operation_name(const WalOperation& op) noexcept {
    switch (op.index()) {
        case 0: return "put";
        case 1: return "delete";
        default: return "clear";
    }
}

// ── WalEntry ─────────────────────────────────────────────────────────────────

WalEntry WalEntry::create(uint64_t sequence_number, WalOperation operation,
                          std::string timestamp, bool with_checksum) {
    WalEntry entry{
        .sequence_number = sequence_number,
        .operation = std::move(operation),
        .timestamp = std::move(timestamp),
        .checksum = std::nullopt,
    };
    if (with_checksum) {
        entry.checksum = entry.compute_checksum();
    }
    return entry;
}

std::string WalEntry::compute_checksum() const {
    std::vector<uint8_t> buf;
    buf.reserve(64);

    write_u64_le(buf, sequence_number);
    std::visit([&buf](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, PutOp>) {
            buf.push_back(kOpTagPut);
            write_string(buf, o.key);
            write_string(buf, o.value);
        } else if constexpr (std::is_same_v<T, DeleteOp>) {
            buf.push_back(kOpTagDelete);
            write_string(buf, o.key);
        } else {
            buf.push_back(kOpTagClear);
        }
    }, operation);
    write_string(buf, timestamp);

    return fmt::format("{:08x}", crc32(buf.data(), buf.size()));
}

bool WalEntry::verify_checksum() const {
    if (!checksum) return true;
    return *checksum == compute_checksum();
}

std::string WalEntry::to_json() const {
    json j;
    j["sequence_number"] = sequence_number;
    j["operation"] = operation_to_json(operation);
    j["timestamp"] = timestamp;
    j["checksum"] = checksum ? json(*checksum) : json(nullptr);

    try {
        return j.dump();
    } catch (const json::exception& e) {
        throw StorageError::internal(
            fmt::format("Failed to serialize WAL entry {}: {}", sequence_number, e.what()));
    }
}

WalEntry WalEntry::from_json(std::string_view line) {
    try {
        auto j = json::parse(line);
        if (!j.is_object()) {
            throw StorageError::internal("WAL record is not a JSON object");
        }

        WalEntry entry;
        entry.sequence_number = j.at("sequence_number").get<uint64_t>();
        entry.operation = operation_from_json(j.at("operation"));
        entry.timestamp = j.at("timestamp").get<std::string>();

        if (auto it = j.find("checksum"); it != j.end() && !it->is_null()) {
            entry.checksum = it->get<std::string>();
        }
        return entry;
    } catch (const json::exception& e) {
        throw StorageError::internal(fmt::format("Failed to parse WAL record: {}", e.what()));
    }
}

// ── WalManager ───────────────────────────────────────────────────────────────

WalManager::WalManager(std::filesystem::path path, bool use_checksums)
    : path_(std::move(path)), use_checksums_(use_checksums)
{
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) fail("Failed to create WAL directory for", path_, ec);
    }

    std::lock_guard lock(mutex_);
    open_locked();
    spdlog::debug("WAL opened at {} (checksums {})", path_.string(),
                  use_checksums_ ? "on" : "off");
}

WalManager::~WalManager() {
    std::lock_guard lock(mutex_);
    close_locked();
}

void WalManager::open_locked() {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        fd_ = -1;
        fail("Failed to open WAL file", path_, make_errno_error());
    }
}

void WalManager::close_locked() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool WalManager::is_open() const {
    std::lock_guard lock(mutex_);
    return fd_ != -1;
}

WalEntry WalManager::log_operation(WalOperation op) {
    std::lock_guard lock(mutex_);

    if (fd_ == -1) {
        throw StorageError::internal(fmt::format("WAL '{}' is not open", path_.string()));
    }

    auto entry = WalEntry::create(sequence_number_ + 1, std::move(op),
                                  current_timestamp(), use_checksums_);
    auto line = entry.to_json();
    line.push_back('\n');

    struct stat st{};
    if (::fstat(fd_, &st) < 0) {
        fail("Failed to stat WAL", path_, make_errno_error());
    }

    if (auto ec = write_bytes(fd_, line)) {
        rollback_locked(st.st_size);
        fail("Failed to append to WAL", path_, ec);
    }

    sequence_number_ = entry.sequence_number;
    return entry;
}

std::vector<WalEntry> WalManager::read_all_entries() {
    std::lock_guard lock(mutex_);

    std::string data;
    if (auto ec = read_file(path_, data)) {
        fail("Failed to read WAL", path_, ec);
    }

    std::vector<WalEntry> entries;
    uint64_t last_seq = 0;
    std::size_t line_no = 0;
    std::size_t pos = 0;
    std::optional<std::size_t> torn_at;
    bool missing_newline = false;

    while (pos < data.size()) {
        const auto line_start = pos;
        auto nl = data.find('\n', pos);
        const bool terminated = nl != std::string::npos;
        std::string_view line(data.data() + pos,
                              (terminated ? nl : data.size()) - pos);
        pos = terminated ? nl + 1 : data.size();
        ++line_no;

        if (line.find_first_not_of(" \t\r") == std::string_view::npos) continue;

        WalEntry entry;
        try {
            entry = WalEntry::from_json(line);
        } catch (const StorageError& e) {
            if (!terminated) {
                spdlog::warn("WAL {}: ignoring incomplete trailing record at line {}",
                             path_.string(), line_no);
                torn_at = line_start;
                break;
            }
            throw StorageError::internal(
                fmt::format("Corrupt WAL record at line {}: {}", line_no, e.detail()));
        }

        if (!entry.verify_checksum()) {
            throw StorageError::internal(fmt::format(
                "Checksum mismatch in WAL entry {} (line {})",
                entry.sequence_number, line_no));
        }
        if (entry.sequence_number <= last_seq) {
            throw StorageError::internal(fmt::format(
                "Out-of-order WAL entry {} after {} (line {})",
                entry.sequence_number, last_seq, line_no));
        }

        missing_newline = !terminated;
        last_seq = entry.sequence_number;
        entries.push_back(std::move(entry));
    }

    // The next append must start on a fresh line.
    if (torn_at) {
        trim_tail_locked(*torn_at);
    } else if (missing_newline) {
        if (fd_ == -1) {
            throw StorageError::internal(fmt::format("WAL '{}' is not open", path_.string()));
        }
        if (auto ec = write_bytes(fd_, "\n")) {
            fail("Failed to terminate last WAL record in", path_, ec);
        }
    }

    if (last_seq > sequence_number_) sequence_number_ = last_seq;

    spdlog::debug("WAL {}: read {} entries (last sequence {})",
                  path_.string(), entries.size(), last_seq);
    return entries;
}

void WalManager::trim_tail_locked(std::size_t size) {
    if (fd_ == -1) {
        throw StorageError::internal(fmt::format("WAL '{}' is not open", path_.string()));
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) < 0) {
        fail("Failed to drop incomplete record from WAL", path_, make_errno_error());
    }
    if (::fdatasync(fd_) < 0) {
        fail("Failed to sync WAL", path_, make_errno_error());
    }
    spdlog::info("WAL {}: truncated incomplete trailing record at offset {}",
                 path_.string(), size);
}

void WalManager::rollback_locked(off_t size) noexcept {
    if (::ftruncate(fd_, size) == 0 && ::fdatasync(fd_) == 0) {
        return;
    }
    spdlog::error("WAL {}: failed append could not be rolled back ({}); "
                  "refusing further writes", path_.string(),
                  make_errno_error().message());
    close_locked();
}

void WalManager::truncate() {
    std::lock_guard lock(mutex_);

    if (fd_ == -1) {
        throw StorageError::internal(fmt::format("WAL '{}' is not open", path_.string()));
    }
    if (::ftruncate(fd_, 0) < 0) {
        fail("Failed to truncate WAL", path_, make_errno_error());
    }
    if (::fdatasync(fd_) < 0) {
        fail("Failed to sync WAL", path_, make_errno_error());
    }

    sequence_number_ = 0;
    spdlog::debug("WAL {} truncated", path_.string());
}

std::size_t WalManager::rewrite(const std::vector<WalOperation>& ops) {
    std::lock_guard lock(mutex_);

    auto tmp_path = path_;
    tmp_path += ".tmp";

    std::string data;
    const auto ts = current_timestamp();
    uint64_t seq = 0;
    for (const auto& op : ops) {
        data += WalEntry::create(++seq, op, ts, use_checksums_).to_json();
        data.push_back('\n');
    }

    int tmp_fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (tmp_fd < 0) {
        fail("Failed to create compacted WAL", tmp_path, make_errno_error());
    }

    auto ec = write_bytes(tmp_fd, data);
    ::close(tmp_fd);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        fail("Failed to write compacted WAL", tmp_path, ec);
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        fail("Failed to replace WAL with", tmp_path, ec);
    }

    // The old descriptor refers to the unlinked file.
    close_locked();
    open_locked();

    sequence_number_ = seq;
    spdlog::debug("WAL {} rewritten with {} entries", path_.string(), ops.size());
    return ops.size();
}

uint64_t WalManager::current_sequence_number() const {
    std::lock_guard lock(mutex_);
    return sequence_number_;
}

} // namespace zephyrite::persistence
