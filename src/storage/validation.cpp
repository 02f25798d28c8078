#include "storage/validation.hpp"

#include "storage/error.hpp"

#include <algorithm>
#include <cstdint>

namespace zephyrite {

namespace {

bool is_ascii_control(unsigned char c) noexcept {
    return c < 0x20 || c == 0x7F;
}

bool contains(std::string_view s, std::string_view needle) noexcept {
    return s.find(needle) != std::string_view::npos;
}

} // anonymous namespace

bool is_valid_utf8(std::string_view s) noexcept {
    const auto* p = reinterpret_cast<const uint8_t*>(s.data());
    const auto* end = p + s.size();

    while (p < end) {
        const uint8_t lead = *p;
        if (lead < 0x80) {
            ++p;
            continue;
        }

        std::size_t extra = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1; cp = lead & 0x1F; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; cp = lead & 0x0F; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; cp = lead & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }

        if (static_cast<std::size_t>(end - p) <= extra) {
            return false;
        }
        for (std::size_t i = 1; i <= extra; ++i) {
            if ((p[i] & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (p[i] & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        p += extra + 1;
    }
    return true;
}

void validate_key(std::string_view key) {
    if (key.empty()) {
        throw StorageError::invalid_key("Key cannot be empty");
    }

    if (key.size() > kMaxKeyLength) {
        throw StorageError::invalid_key("Key too long (max 1024 bytes)");
    }

    // Only spaces here; tabs are caught by the control character check.
    if (key.front() == ' ' || key.back() == ' ') {
        throw StorageError::invalid_key("Key cannot start or end with spaces");
    }

    if (contains(key, std::string_view("\0", 1))) {
        throw StorageError::invalid_key("Key cannot contain null bytes");
    }

    if (contains(key, "\n") || contains(key, "\r")) {
        throw StorageError::invalid_key("Key cannot contain line breaks");
    }

    if (std::any_of(key.begin(), key.end(),
                    [](char c) { return is_ascii_control(static_cast<unsigned char>(c)); })) {
        throw StorageError::invalid_key("Key cannot contain control characters");
    }

    if (!is_valid_utf8(key)) {
        throw StorageError::invalid_key("Key must be valid UTF-8");
    }

    if (key.starts_with(kReservedKeyPrefix)) {
        throw StorageError::invalid_key(
            "Keys cannot start with '__zephyrite_' (reserved prefix)");
    }

    if (contains(key, "..")) {
        throw StorageError::invalid_key("Key cannot contain '..' (security risk)");
    }
}

void validate_key_strict(std::string_view key, bool allow_slashes, bool allow_dots) {
    validate_key(key);

    if (!allow_slashes && (contains(key, "/") || contains(key, "\\"))) {
        throw StorageError::invalid_key("Key cannot contain path separators");
    }

    if (!allow_dots && contains(key, ".")) {
        throw StorageError::invalid_key("Key cannot contain dots");
    }

    if (contains(key, "::") || contains(key, "--") || contains(key, "__")) {
        throw StorageError::invalid_key(
            "Key cannot contain consecutive special characters");
    }
}

void validate_key(std::string_view key, const KeyPolicy& policy) {
    if (policy.strict) {
        validate_key_strict(key, policy.allow_slashes, policy.allow_dots);
    } else {
        validate_key(key);
    }
}

void validate_value(std::string_view value) {
    if (value.size() > kMaxValueLength) {
        throw StorageError::invalid_value("Value too large (max 1MB)");
    }

    if (!is_valid_utf8(value)) {
        throw StorageError::invalid_value("Value must be valid UTF-8");
    }
}

} // namespace zephyrite
