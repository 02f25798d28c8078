#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zephyrite {

// ── StorageErrorKind ─────────────────────────────────────────────────────────
//
// KeyAlreadyExists and UnsupportedOperation are reserved for backend-specific
// gaps; neither built-in backend raises KeyAlreadyExists.

enum class StorageErrorKind : uint8_t {
    KeyNotFound,
    KeyAlreadyExists,
    InvalidKey,
    InvalidValue,
    Internal,
    UnsupportedOperation,
};

// ── StorageError ─────────────────────────────────────────────────────────────
//
// Raised by every storage operation that cannot complete.  what() returns the
// kind prefix followed by the detail, e.g. "Key not found: user:1".

class StorageError : public std::runtime_error {
public:
    StorageError(StorageErrorKind kind, std::string detail);

    [[nodiscard]] StorageErrorKind kind() const noexcept { return kind_; }

    // The message without the kind prefix.
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    // Status code used by the request layer:
    //   KeyNotFound → 404, InvalidKey / InvalidValue → 400, everything else → 500.
    [[nodiscard]] int status_code() const noexcept;

    // Named constructors, one per kind.
    [[nodiscard]] static StorageError key_not_found(std::string_view key);
    [[nodiscard]] static StorageError key_already_exists(std::string_view key);
    [[nodiscard]] static StorageError invalid_key(std::string detail);
    [[nodiscard]] static StorageError invalid_value(std::string detail);
    [[nodiscard]] static StorageError internal(std::string detail);
    [[nodiscard]] static StorageError unsupported(std::string detail);

private:
    StorageErrorKind kind_;
    std::string detail_;
};

// Human-readable prefix used in what(), e.g. "Invalid key".
[[nodiscard]] std::string_view to_string(StorageErrorKind kind) noexcept;

// Status code for `kind` (see StorageError::status_code()).
[[nodiscard]] int status_code(StorageErrorKind kind) noexcept;

} // namespace zephyrite
