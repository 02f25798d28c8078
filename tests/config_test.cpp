#include "common/config.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace zephyrite {

// ── Helpers ───────────────────────────────────────────────────────────────────

// Build a fake argv array from a vector of strings.
// The returned pointers are valid as long as `args` is alive.
static std::vector<char*> make_argv(std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (auto& s : args) {
        argv.push_back(s.data());
    }
    return argv;
}

static ServerConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "zephyrite-server");
    auto argv = make_argv(args);
    return parse_config(static_cast<int>(argv.size()), argv.data());
}

// Returns the message parse() throws, or an empty string if it succeeds.
static std::string parse_error(std::vector<std::string> args) {
    try {
        (void)parse(std::move(args));
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return {};
}

// ── Defaults ──────────────────────────────────────────────────────────────────

TEST(ConfigTest, DefaultsToMemoryBackend) {
    auto cfg = parse({});

    EXPECT_EQ(cfg.host,      "127.0.0.1");
    EXPECT_EQ(cfg.port,      8080u);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.storage.kind, StorageKind::Memory);
    EXPECT_TRUE(cfg.storage.wal_path.empty());
    EXPECT_FALSE(cfg.storage.memory_capacity.has_value());
    EXPECT_TRUE(cfg.storage.use_checksums);
    EXPECT_FALSE(cfg.storage.key_policy.strict);
}

TEST(ConfigTest, ParsesNetworkOptions) {
    auto cfg = parse({"--host", "0.0.0.0", "-p", "9000", "--log-level", "debug"});
    EXPECT_EQ(cfg.host,      "0.0.0.0");
    EXPECT_EQ(cfg.port,      9000u);
    EXPECT_EQ(cfg.log_level, "debug");
}

// ── Storage selection ─────────────────────────────────────────────────────────

TEST(ConfigTest, PersistentUsesDefaultWalFile) {
    auto cfg = parse({"--persistent"});
    EXPECT_EQ(cfg.storage.kind, StorageKind::Persistent);
    EXPECT_EQ(cfg.storage.wal_path, "zephyrite.wal");
}

TEST(ConfigTest, WalFileImpliesPersistent) {
    auto cfg = parse({"--wal-file", "/tmp/data/store.wal"});
    EXPECT_EQ(cfg.storage.kind, StorageKind::Persistent);
    EXPECT_EQ(cfg.storage.wal_path, "/tmp/data/store.wal");
}

TEST(ConfigTest, StorageTuningOptions) {
    auto cfg = parse({"--persistent", "--memory-capacity", "10000", "--no-checksums"});
    ASSERT_TRUE(cfg.storage.memory_capacity.has_value());
    EXPECT_EQ(*cfg.storage.memory_capacity, 10000u);
    EXPECT_FALSE(cfg.storage.use_checksums);
}

TEST(ConfigTest, StrictKeyPolicy) {
    auto cfg = parse({"--strict-keys", "--strict-allow-dots"});
    EXPECT_TRUE(cfg.storage.key_policy.strict);
    EXPECT_FALSE(cfg.storage.key_policy.allow_slashes);
    EXPECT_TRUE(cfg.storage.key_policy.allow_dots);
}

// ── Validation errors ─────────────────────────────────────────────────────────

TEST(ConfigTest, RejectsPortZero) {
    EXPECT_EQ(parse_error({"--port", "0"}), "Port for --port must be in [1, 65535], got 0");
}

TEST(ConfigTest, RejectsPortOutOfRange) {
    EXPECT_EQ(parse_error({"--port", "70000"}).rfind("Argument error:", 0), 0u);
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    EXPECT_EQ(parse_error({"--log-level", "verbose"}),
              "--log-level must be one of trace|debug|info|warn|error|critical, got 'verbose'");
}

TEST(ConfigTest, RejectsEmptyWalFile) {
    EXPECT_EQ(parse_error({"--wal-file", ""}), "--wal-file must not be empty");
}

TEST(ConfigTest, RejectsAllowFlagsWithoutStrictKeys) {
    EXPECT_EQ(parse_error({"--strict-allow-slashes"}),
              "--strict-allow-slashes and --strict-allow-dots require --strict-keys");
}

TEST(ConfigTest, RejectsUnknownOption) {
    EXPECT_EQ(parse_error({"--peers", "x"}).rfind("Argument error:", 0), 0u);
}

TEST(ConfigTest, HelpThrowsWithOptionSummary) {
    auto msg = parse_error({"--help"});
    EXPECT_NE(msg.find("--wal-file"), std::string::npos);
    EXPECT_NE(msg.find("--strict-keys"), std::string::npos);
}

} // namespace zephyrite
