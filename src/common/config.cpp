#include "common/config.hpp"

#include <array>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace zephyrite {

namespace {

constexpr std::string_view kDefaultWalFile = "zephyrite.wal";

constexpr std::array<std::string_view, 6> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical",
};

// Validate the fully populated ServerConfig.
void validate(const ServerConfig& cfg) {
    if (cfg.port == 0) {
        throw std::runtime_error("Port for --port must be in [1, 65535], got 0");
    }
    if (cfg.host.empty()) {
        throw std::runtime_error("--host must not be empty");
    }

    bool known_level = false;
    for (auto level : kLogLevels) {
        if (cfg.log_level == level) known_level = true;
    }
    if (!known_level) {
        throw std::runtime_error(fmt::format(
            "--log-level must be one of trace|debug|info|warn|error|critical, got '{}'",
            cfg.log_level));
    }

    if (cfg.storage.kind == StorageKind::Persistent && cfg.storage.wal_path.empty()) {
        throw std::runtime_error("--wal-file must not be empty");
    }
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("127.0.0.1"),
            "Bind address for client connections")
        ("port,p",
            po::value<uint16_t>()->default_value(8080),
            "Port for client (text protocol) connections")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical")
        ("persistent",
            po::bool_switch(),
            "Use WAL-backed persistent storage instead of memory only")
        ("wal-file",
            po::value<std::string>(),
            "WAL file path (implies --persistent; default zephyrite.wal)")
        ("memory-capacity",
            po::value<std::size_t>(),
            "Initial key capacity hint for the in-memory map")
        ("no-checksums",
            po::bool_switch(),
            "Write WAL entries without checksums")
        ("strict-keys",
            po::bool_switch(),
            "Reject keys containing '::', '--' or '__'")
        ("strict-allow-slashes",
            po::bool_switch(),
            "With --strict-keys: allow '/' and '\\' in keys")
        ("strict-allow-dots",
            po::bool_switch(),
            "With --strict-keys: allow '.' in keys");
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServerConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("zephyrite-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(
            po::parse_command_line(argc, argv, desc),
            vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    const bool strict = vm["strict-keys"].as<bool>();
    const bool allow_slashes = vm["strict-allow-slashes"].as<bool>();
    const bool allow_dots = vm["strict-allow-dots"].as<bool>();
    if (!strict && (allow_slashes || allow_dots)) {
        throw std::runtime_error("--strict-allow-slashes and --strict-allow-dots require --strict-keys");
    }

    ServerConfig cfg;
    cfg.host      = vm["host"].as<std::string>();
    cfg.port      = vm["port"].as<uint16_t>();
    cfg.log_level = vm["log-level"].as<std::string>();

    auto& storage = cfg.storage;
    const bool has_wal_file = vm.count("wal-file") > 0;
    storage.kind = (vm["persistent"].as<bool>() || has_wal_file)
        ? StorageKind::Persistent
        : StorageKind::Memory;
    if (storage.kind == StorageKind::Persistent) {
        storage.wal_path = has_wal_file ? vm["wal-file"].as<std::string>()
                                        : std::string(kDefaultWalFile);
    }
    if (vm.count("memory-capacity")) {
        storage.memory_capacity = vm["memory-capacity"].as<std::size_t>();
    }
    storage.use_checksums = !vm["no-checksums"].as<bool>();

    // Outside strict mode the allow_* flags are ignored, so leave the
    // permissive defaults in place.
    storage.key_policy.strict = strict;
    if (strict) {
        storage.key_policy.allow_slashes = allow_slashes;
        storage.key_policy.allow_dots = allow_dots;
    }

    validate(cfg);
    return cfg;
}

} // namespace zephyrite
