#include "storage/error.hpp"
#include "storage/validation.hpp"

#include <string>
#include <string_view>

#include <gtest/gtest.h>

namespace zephyrite {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Runs `fn` and returns the StorageError it throws.  Fails the test if it
// returns normally.
template <typename Fn>
static StorageError expect_storage_error(Fn&& fn) {
    try {
        fn();
    } catch (const StorageError& e) {
        return e;
    }
    ADD_FAILURE() << "expected StorageError";
    return StorageError::internal("no error thrown");
}

static std::string key_error(std::string_view key) {
    auto e = expect_storage_error([&] { validate_key(key); });
    EXPECT_EQ(e.kind(), StorageErrorKind::InvalidKey);
    return e.detail();
}

static std::string strict_error(std::string_view key, bool allow_slashes, bool allow_dots) {
    auto e = expect_storage_error([&] { validate_key_strict(key, allow_slashes, allow_dots); });
    EXPECT_EQ(e.kind(), StorageErrorKind::InvalidKey);
    return e.detail();
}

// ── validate_key: accepted ────────────────────────────────────────────────────

TEST(ValidateKey, AcceptsOrdinaryKeys) {
    EXPECT_NO_THROW(validate_key("user:123"));
    EXPECT_NO_THROW(validate_key("a"));
    EXPECT_NO_THROW(validate_key("with inner space"));
    EXPECT_NO_THROW(validate_key("path/to/key"));
    EXPECT_NO_THROW(validate_key("file.txt"));
    EXPECT_NO_THROW(validate_key("double__underscore"));
}

TEST(ValidateKey, AcceptsNonAsciiUnicode) {
    EXPECT_NO_THROW(validate_key("\xE3\x83\xA6\xE3\x83\xBC\xE3\x82\xB6\xE3\x83\xBC"));  // ユーザー
    EXPECT_NO_THROW(validate_key("caf\xC3\xA9"));
    EXPECT_NO_THROW(validate_key("\xF0\x9F\x94\x91"));  // U+1F511
}

TEST(ValidateKey, AcceptsExactlyMaxLength) {
    EXPECT_NO_THROW(validate_key(std::string(kMaxKeyLength, 'k')));
}

// ── validate_key: rejected ────────────────────────────────────────────────────

TEST(ValidateKey, RejectsEmpty) {
    EXPECT_EQ(key_error(""), "Key cannot be empty");
}

TEST(ValidateKey, RejectsOverMaxLength) {
    EXPECT_EQ(key_error(std::string(kMaxKeyLength + 1, 'k')), "Key too long (max 1024 bytes)");
}

TEST(ValidateKey, RejectsLeadingOrTrailingSpace) {
    EXPECT_EQ(key_error(" key"), "Key cannot start or end with spaces");
    EXPECT_EQ(key_error("key "), "Key cannot start or end with spaces");
}

TEST(ValidateKey, RejectsNulByte) {
    EXPECT_EQ(key_error(std::string_view("ke\0y", 4)), "Key cannot contain null bytes");
}

TEST(ValidateKey, RejectsLineBreaks) {
    EXPECT_EQ(key_error("line\nbreak"), "Key cannot contain line breaks");
    EXPECT_EQ(key_error("carriage\rreturn"), "Key cannot contain line breaks");
}

TEST(ValidateKey, RejectsOtherControlCharacters) {
    EXPECT_EQ(key_error("tab\there"), "Key cannot contain control characters");
    EXPECT_EQ(key_error("bell\x07"), "Key cannot contain control characters");
    EXPECT_EQ(key_error("del\x7F"), "Key cannot contain control characters");
}

TEST(ValidateKey, RejectsReservedPrefix) {
    EXPECT_EQ(key_error("__zephyrite_internal"),
              "Keys cannot start with '__zephyrite_' (reserved prefix)");
    EXPECT_NO_THROW(validate_key("x__zephyrite_internal"));
}

TEST(ValidateKey, RejectsDoubleDot) {
    EXPECT_EQ(key_error("../etc/passwd"), "Key cannot contain '..' (security risk)");
    EXPECT_EQ(key_error("a..b"), "Key cannot contain '..' (security risk)");
}

TEST(ValidateKey, RejectsMalformedUtf8) {
    EXPECT_EQ(key_error("\xFF"), "Key must be valid UTF-8");
    EXPECT_EQ(key_error("\xC0\xAF"), "Key must be valid UTF-8");        // overlong '/'
    EXPECT_EQ(key_error("\xED\xA0\x80"), "Key must be valid UTF-8");    // surrogate
    EXPECT_EQ(key_error("abc\xE2\x82"), "Key must be valid UTF-8");     // truncated
}

TEST(ValidateKey, WhatIncludesKindPrefix) {
    auto e = expect_storage_error([] { validate_key(""); });
    EXPECT_STREQ(e.what(), "Invalid key: Key cannot be empty");
    EXPECT_EQ(e.status_code(), 400);
}

// ── validate_key_strict ───────────────────────────────────────────────────────

TEST(ValidateKeyStrict, RunsStandardChecksFirst) {
    EXPECT_EQ(strict_error("", true, true), "Key cannot be empty");
    EXPECT_EQ(strict_error("a..b", true, true), "Key cannot contain '..' (security risk)");
}

TEST(ValidateKeyStrict, PathSeparatorsDependOnFlag) {
    EXPECT_NO_THROW(validate_key_strict("a/b", true, true));
    EXPECT_EQ(strict_error("a/b", false, true), "Key cannot contain path separators");
    EXPECT_EQ(strict_error("a\\b", false, true), "Key cannot contain path separators");
}

TEST(ValidateKeyStrict, DotsDependOnFlag) {
    EXPECT_NO_THROW(validate_key_strict("a.b", true, true));
    EXPECT_EQ(strict_error("a.b", true, false), "Key cannot contain dots");
}

TEST(ValidateKeyStrict, RejectsConsecutiveSpecials) {
    EXPECT_EQ(strict_error("a::b", true, true), "Key cannot contain consecutive special characters");
    EXPECT_EQ(strict_error("a--b", true, true), "Key cannot contain consecutive special characters");
    EXPECT_EQ(strict_error("a__b", true, true), "Key cannot contain consecutive special characters");
    EXPECT_NO_THROW(validate_key_strict("a:b-c_d", true, true));
}

TEST(ValidateKeyPolicy, DispatchesOnStrictFlag) {
    KeyPolicy lenient;
    KeyPolicy strict{.strict = true, .allow_slashes = false, .allow_dots = false};

    EXPECT_NO_THROW(validate_key("a__b.c/d", lenient));
    EXPECT_THROW(validate_key("a__b", strict), StorageError);
    EXPECT_THROW(validate_key("a.b", strict), StorageError);
    EXPECT_THROW(validate_key("a/b", strict), StorageError);
    EXPECT_NO_THROW(validate_key("a:b", strict));
}

// ── validate_value ────────────────────────────────────────────────────────────

TEST(ValidateValue, AcceptsEmptyAndArbitraryText) {
    EXPECT_NO_THROW(validate_value(""));
    EXPECT_NO_THROW(validate_value("line one\nline two\ttabbed"));
    EXPECT_NO_THROW(validate_value(std::string_view("nul\0inside", 10)));
}

TEST(ValidateValue, AcceptsExactlyOneMebibyte) {
    EXPECT_NO_THROW(validate_value(std::string(kMaxValueLength, 'v')));
}

TEST(ValidateValue, RejectsOverOneMebibyte) {
    auto e = expect_storage_error([] { validate_value(std::string(kMaxValueLength + 1, 'v')); });
    EXPECT_EQ(e.kind(), StorageErrorKind::InvalidValue);
    EXPECT_STREQ(e.what(), "Invalid value: Value too large (max 1MB)");
}

TEST(ValidateValue, RejectsMalformedUtf8) {
    auto e = expect_storage_error([] { validate_value("bad\xFE"); });
    EXPECT_EQ(e.kind(), StorageErrorKind::InvalidValue);
    EXPECT_EQ(e.detail(), "Value must be valid UTF-8");
}

// ── is_valid_utf8 ─────────────────────────────────────────────────────────────

TEST(Utf8, BoundaryCodePoints) {
    EXPECT_TRUE(is_valid_utf8("\x7F"));
    EXPECT_TRUE(is_valid_utf8("\xC2\x80"));             // U+0080
    EXPECT_TRUE(is_valid_utf8("\xEF\xBF\xBF"));         // U+FFFF
    EXPECT_TRUE(is_valid_utf8("\xF4\x8F\xBF\xBF"));     // U+10FFFF
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));    // U+110000
    EXPECT_FALSE(is_valid_utf8("\xE0\x80\x80"));        // overlong NUL
    EXPECT_FALSE(is_valid_utf8("\x80"));                // stray continuation
}

} // namespace zephyrite
