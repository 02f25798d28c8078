#pragma once

#include "storage/value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace zephyrite::network {

// ── Commands ──────────────────────────────────────────────────────────────────
//
// Parsed representation of a single client command.  Each command type is a
// plain struct; the whole thing is wrapped in a std::variant so callers can
// std::visit over it without inheritance.

struct PingCmd {};

struct GetCmd {
    std::string key;
};

struct SetCmd {
    std::string key;
    std::string value;
};

struct DelCmd {
    std::string key;
};

struct ExistsCmd {
    std::string key;
};

struct SizeCmd {
    std::string key;
};

struct KeysCmd {};
struct StatsCmd {};
struct ClearCmd {};
struct CompactCmd {};

using Command = std::variant<PingCmd, GetCmd, SetCmd, DelCmd, ExistsCmd, SizeCmd,
                             KeysCmd, StatsCmd, ClearCmd, CompactCmd>;

// ── Responses ─────────────────────────────────────────────────────────────────

struct OkResp {};
struct PongResp {};
struct CreatedResp {};
struct UpdatedResp {};
struct DeletedResp {};
struct NotFoundResp {};

struct ValueResp {
    std::string value;
};

struct BoolResp {
    bool value;
};

struct SizeResp {
    std::size_t size;
};

struct KeysResp {
    std::vector<std::string> keys;
};

struct StatsResp {
    Stats stats;
};

struct CompactedResp {
    std::size_t entries_before;
    std::size_t entries_after;
};

// `status` follows StorageError::status_code(); malformed requests are 400.
struct ErrorResp {
    int status;
    std::string message;
};

using Response =
    std::variant<OkResp, PongResp, CreatedResp, UpdatedResp, DeletedResp, NotFoundResp,
                 ValueResp, BoolResp, SizeResp, KeysResp, StatsResp, CompactedResp, ErrorResp>;

// ── Protocol ──────────────────────────────────────────────────────────────────
//
// Line-oriented text protocol.  One command per '\n'-terminated line:
//
//   PING | GET k | SET k v | DEL k | EXISTS k | SIZE k | KEYS | STATS |
//   CLEAR | COMPACT
//
// Verbs are case-sensitive.  Keys are single tokens; the SET value is the rest
// of the line after "SET <key> " and may contain spaces (or be empty).
//
// A key or value may instead be written as a JSON string literal, e.g.
// SET "a b" "line1\nline2".  Replies use the same form for any key with a
// space and any value with a line break, so every reply stays on one line.
// Plain fields that start with '"' are always quoted.

// Stateless helper: parse one line (without the trailing '\n') into a Command.
// Returns ErrorResp on malformed input, so callers can directly serialize the
// error back to the client.
//
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::variant<Command, ErrorResp> parse_command(std::string_view line);

// Serialize a Response into a wire-ready string (always ends with '\n').
// Thread-safe: pure function, no shared state.
[[nodiscard]] std::string serialize_response(const Response& response);

} // namespace zephyrite::network
