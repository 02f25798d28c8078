#pragma once

#include "storage/storage_factory.hpp"

#include <cstdint>
#include <string>

#include <boost/program_options.hpp>

namespace zephyrite {

// ── ServerConfig ──────────────────────────────────────────────────────────────
// Full configuration for one zephyrite-server process.
// Populated by parse_config() from CLI arguments.

struct ServerConfig {
    std::string   host;        // Bind address for client connections
    uint16_t      port;        // Port for client (text protocol) connections
    std::string   log_level;   // spdlog level string
    StorageConfig storage;     // Backend selection and options
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a ServerConfig.
//
// On success: returns a fully validated ServerConfig.
// On error  : throws std::runtime_error with a human-readable message.
//             --help also throws, with the option summary as the message.
//
// Validates:
//   - port in [1, 65535]
//   - log level is one of trace|debug|info|warn|error|critical
//   - --wal-file is not empty
//   - --strict-allow-* only together with --strict-keys
//
// --wal-file implies --persistent.

[[nodiscard]] ServerConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with server options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

} // namespace zephyrite
