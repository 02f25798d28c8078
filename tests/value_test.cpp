#include "common/time.hpp"
#include "storage/error.hpp"
#include "storage/value.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace zephyrite {

// ── Timestamps ────────────────────────────────────────────────────────────────

TEST(Timestamp, FormatsEpochAsIsoUtcWithMillis) {
    std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(format_timestamp(epoch), "1970-01-01T00:00:00.000Z");
}

TEST(Timestamp, KeepsMilliseconds) {
    using namespace std::chrono;
    system_clock::time_point tp{seconds{1'700'000'000} + milliseconds{42}};
    EXPECT_EQ(format_timestamp(tp), "2023-11-14T22:13:20.042Z");
}

TEST(Timestamp, LexicographicOrderMatchesTimeOrder) {
    using namespace std::chrono;
    system_clock::time_point a{seconds{999'999'999} + milliseconds{999}};
    system_clock::time_point b{seconds{1'000'000'000}};
    EXPECT_LT(format_timestamp(a), format_timestamp(b));
}

TEST(Timestamp, CurrentTimestampHasFixedShape) {
    auto ts = current_timestamp();
    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}

// ── Value ─────────────────────────────────────────────────────────────────────

TEST(Value, CreateStampsBothTimestamps) {
    auto v = Value::create("hello", "2025-01-01T00:00:00.000Z");
    EXPECT_EQ(v.content, "hello");
    EXPECT_EQ(v.metadata.size, 5u);
    EXPECT_EQ(v.metadata.created_at, "2025-01-01T00:00:00.000Z");
    EXPECT_EQ(v.metadata.updated_at, "2025-01-01T00:00:00.000Z");
}

TEST(Value, SizeIsByteLengthNotCharacterCount) {
    auto v = Value::create("h\xC3\xA9llo");  // "héllo"
    EXPECT_EQ(v.metadata.size, 6u);
}

TEST(Value, ReplacedByKeepsCreatedAtAndRefreshesUpdatedAt) {
    auto first = Value::create("a", "2025-01-01T00:00:00.000Z");
    auto second = first.replaced_by("bbb", "2025-06-01T12:00:00.000Z");

    EXPECT_EQ(second.content, "bbb");
    EXPECT_EQ(second.metadata.size, 3u);
    EXPECT_EQ(second.metadata.created_at, "2025-01-01T00:00:00.000Z");
    EXPECT_EQ(second.metadata.updated_at, "2025-06-01T12:00:00.000Z");
}

TEST(Value, ReplacedByNeverMovesUpdatedAtBeforeCreatedAt) {
    auto first = Value::create("a", "2025-06-01T00:00:00.000Z");
    auto second = first.replaced_by("b", "2025-01-01T00:00:00.000Z");
    EXPECT_GE(second.metadata.updated_at, second.metadata.created_at);
}

// ── StorageError ──────────────────────────────────────────────────────────────

TEST(StorageError, WhatCarriesKindPrefix) {
    EXPECT_STREQ(StorageError::key_not_found("foo").what(), "Key not found: foo");
    EXPECT_STREQ(StorageError::invalid_key("Key cannot be empty").what(),
                 "Invalid key: Key cannot be empty");
    EXPECT_STREQ(StorageError::internal("disk on fire").what(),
                 "Internal storage error: disk on fire");
}

TEST(StorageError, DetailOmitsPrefix) {
    auto e = StorageError::invalid_value("Value too large (max 1MB)");
    EXPECT_EQ(e.kind(), StorageErrorKind::InvalidValue);
    EXPECT_EQ(e.detail(), "Value too large (max 1MB)");
}

TEST(StorageError, StatusCodes) {
    EXPECT_EQ(StorageError::key_not_found("k").status_code(), 404);
    EXPECT_EQ(StorageError::invalid_key("x").status_code(), 400);
    EXPECT_EQ(StorageError::invalid_value("x").status_code(), 400);
    EXPECT_EQ(StorageError::internal("x").status_code(), 500);
    EXPECT_EQ(StorageError::unsupported("x").status_code(), 500);
    EXPECT_EQ(StorageError::key_already_exists("k").status_code(), 500);
}

TEST(StorageError, IsARuntimeError) {
    try {
        throw StorageError::internal("boom");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Internal storage error: boom");
        return;
    }
    FAIL() << "StorageError was not caught as std::runtime_error";
}

} // namespace zephyrite
