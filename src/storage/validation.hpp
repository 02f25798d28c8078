#pragma once

#include <cstddef>
#include <string_view>

namespace zephyrite {

// ── Limits ───────────────────────────────────────────────────────────────────

static constexpr std::size_t kMaxKeyLength = 1024;          // bytes
static constexpr std::size_t kMaxValueLength = 1'048'576;   // 1 MiB
static constexpr std::string_view kReservedKeyPrefix = "__zephyrite_";

// ── KeyPolicy ────────────────────────────────────────────────────────────────
//
// Selects which key validator a backend applies.  With `strict` off only the
// standard checks run and the allow_* flags are ignored.

struct KeyPolicy {
    bool strict = false;
    bool allow_slashes = true;
    bool allow_dots = true;
};

// ── Validators ───────────────────────────────────────────────────────────────
//
// All validators throw StorageError (InvalidKey / InvalidValue) on rejection
// and return normally otherwise.  They are pure and thread-safe.

// Standard key rules:
//   - non-empty, at most kMaxKeyLength bytes, well-formed UTF-8
//   - no leading or trailing space
//   - no NUL, CR, LF or other ASCII control characters (0x00–0x1F, 0x7F)
//   - must not start with kReservedKeyPrefix
//   - must not contain ".."
void validate_key(std::string_view key);

// Standard rules plus: no '/' or '\\' unless allow_slashes, no '.' unless
// allow_dots, and no "::", "--" or "__" anywhere.
void validate_key_strict(std::string_view key, bool allow_slashes, bool allow_dots);

// Dispatches to validate_key() or validate_key_strict() according to `policy`.
void validate_key(std::string_view key, const KeyPolicy& policy);

// Values may hold any well-formed UTF-8 text up to kMaxValueLength bytes.
void validate_value(std::string_view value);

// True if `s` is well-formed UTF-8 (no overlongs, surrogates or code points
// above U+10FFFF).
[[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept;

} // namespace zephyrite
