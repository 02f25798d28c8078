#include "network/protocol.hpp"

#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace zephyrite::network {

// ── Helpers ───────────────────────────────────────────────────────────────────

namespace {

constexpr int kBadRequest = 400;

// Split `line` on the first space, returning {head, rest}.
// If there is no space, rest is empty.
std::pair<std::string_view, std::string_view> split_once(std::string_view line) {
    const auto pos = line.find(' ');
    if (pos == std::string_view::npos) {
        return {line, {}};
    }
    return {line.substr(0, pos), line.substr(pos + 1)};
}

ErrorResp bad_request(std::string message) {
    return ErrorResp{kBadRequest, std::move(message)};
}

// ── Quoted fields ─────────────────────────────────────────────────────────────
//
// A field that cannot travel as plain text is sent as a JSON string literal.
// Keys need quoting when they contain a space; values when they contain a line
// break.  Anything starting with '"' is quoted so it cannot be misread.

bool is_quoted(std::string_view field) {
    return !field.empty() && field.front() == '"';
}

bool key_needs_quoting(std::string_view key) {
    return is_quoted(key) || key.empty() ||
           key.find_first_of(" \r\n") != std::string_view::npos;
}

bool value_needs_quoting(std::string_view value) {
    return is_quoted(value) || value.find_first_of("\r\n") != std::string_view::npos;
}

std::string quote(std::string_view field) {
    return nlohmann::json(std::string(field))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Splits a leading quoted field off `text`, which must start with '"'.
// Returns the decoded field and whatever follows the closing quote.
std::variant<std::pair<std::string, std::string_view>, ErrorResp>
take_quoted(std::string_view text) {
    std::size_t end = 1;
    while (end < text.size() && text[end] != '"') {
        end += text[end] == '\\' ? 2 : 1;
    }
    if (end >= text.size()) {
        return bad_request("unterminated quoted field");
    }

    try {
        auto decoded = nlohmann::json::parse(text.substr(0, end + 1)).get<std::string>();
        return std::pair{std::move(decoded), text.substr(end + 1)};
    } catch (const nlohmann::json::exception&) {
        return bad_request("invalid quoted field");
    }
}

// Parses "<VERB> key" where key is exactly one token.
template <typename Cmd>
std::variant<Command, ErrorResp> parse_single_key(std::string_view verb, std::string_view rest) {
    if (rest.empty()) {
        return bad_request(fmt::format("{} requires a key", verb));
    }
    if (is_quoted(rest)) {
        auto taken = take_quoted(rest);
        if (auto* err = std::get_if<ErrorResp>(&taken)) return *err;
        auto& [key, extra] = std::get<0>(taken);
        if (!extra.empty()) {
            return bad_request(fmt::format("{} takes exactly one argument", verb));
        }
        return Cmd{std::move(key)};
    }
    auto [key, extra] = split_once(rest);
    if (key.empty() || !extra.empty()) {
        return bad_request(fmt::format("{} takes exactly one argument", verb));
    }
    return Cmd{std::string(key)};
}

// Parses a verb that takes no arguments.
template <typename Cmd>
std::variant<Command, ErrorResp> parse_no_args(std::string_view verb, std::string_view rest) {
    if (!rest.empty()) {
        return bad_request(fmt::format("{} takes no arguments", verb));
    }
    return Cmd{};
}

} // namespace

// ── parse_command ─────────────────────────────────────────────────────────────

std::variant<Command, ErrorResp> parse_command(std::string_view line) {
    // Strip trailing '\r' so the parser is CRLF-tolerant.
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    if (line.empty()) {
        return bad_request("empty command");
    }

    auto [verb, rest] = split_once(line);

    if (verb == "PING")    return parse_no_args<PingCmd>(verb, rest);
    if (verb == "KEYS")    return parse_no_args<KeysCmd>(verb, rest);
    if (verb == "STATS")   return parse_no_args<StatsCmd>(verb, rest);
    if (verb == "CLEAR")   return parse_no_args<ClearCmd>(verb, rest);
    if (verb == "COMPACT") return parse_no_args<CompactCmd>(verb, rest);

    if (verb == "GET")    return parse_single_key<GetCmd>(verb, rest);
    if (verb == "DEL")    return parse_single_key<DelCmd>(verb, rest);
    if (verb == "EXISTS") return parse_single_key<ExistsCmd>(verb, rest);
    if (verb == "SIZE")   return parse_single_key<SizeCmd>(verb, rest);

    // ── SET key value ─────────────────────────────────────────────────────────
    //
    // The value is everything after "SET <key> "; it may contain spaces.
    // Either field may be quoted.
    if (verb == "SET") {
        if (rest.empty()) {
            return bad_request("SET requires a key and a value");
        }

        std::string key;
        std::string_view after_key;
        if (is_quoted(rest)) {
            auto taken = take_quoted(rest);
            if (auto* err = std::get_if<ErrorResp>(&taken)) return *err;
            std::tie(key, after_key) = std::move(std::get<0>(taken));
            if (after_key.empty()) {
                return bad_request("SET requires a value");
            }
            if (after_key.front() != ' ') {
                return bad_request("SET: expected a space after the key");
            }
            after_key.remove_prefix(1);
        } else {
            const auto pos = rest.find(' ');
            if (pos == std::string_view::npos) {
                return bad_request("SET requires a value");
            }
            key = std::string(rest.substr(0, pos));
            if (key.empty()) {
                return bad_request("SET: key must not be empty");
            }
            after_key = rest.substr(pos + 1);
        }

        if (!is_quoted(after_key)) {
            return SetCmd{std::move(key), std::string(after_key)};
        }
        auto taken = take_quoted(after_key);
        if (auto* err = std::get_if<ErrorResp>(&taken)) return *err;
        auto& [value, extra] = std::get<0>(taken);
        if (!extra.empty()) {
            return bad_request("SET: unexpected text after quoted value");
        }
        return SetCmd{std::move(key), std::move(value)};
    }

    return bad_request("unknown command: " + std::string(verb));
}

// ── serialize_response ────────────────────────────────────────────────────────

std::string serialize_response(const Response& response) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, OkResp>) {
                return "OK\n";
            } else if constexpr (std::is_same_v<T, PongResp>) {
                return "PONG\n";
            } else if constexpr (std::is_same_v<T, CreatedResp>) {
                return "CREATED\n";
            } else if constexpr (std::is_same_v<T, UpdatedResp>) {
                return "UPDATED\n";
            } else if constexpr (std::is_same_v<T, DeletedResp>) {
                return "DELETED\n";
            } else if constexpr (std::is_same_v<T, NotFoundResp>) {
                return "NOT_FOUND\n";
            } else if constexpr (std::is_same_v<T, ValueResp>) {
                return "VALUE " +
                       (value_needs_quoting(r.value) ? quote(r.value) : r.value) + "\n";
            } else if constexpr (std::is_same_v<T, BoolResp>) {
                return r.value ? "TRUE\n" : "FALSE\n";
            } else if constexpr (std::is_same_v<T, SizeResp>) {
                return fmt::format("SIZE {}\n", r.size);
            } else if constexpr (std::is_same_v<T, KeysResp>) {
                std::string out = "KEYS";
                for (const auto& k : r.keys) {
                    out += ' ';
                    out += key_needs_quoting(k) ? quote(k) : k;
                }
                out += '\n';
                return out;
            } else if constexpr (std::is_same_v<T, StatsResp>) {
                return fmt::format("STATS key_count={} memory_usage={} gets={} puts={} deletes={}\n",
                                   r.stats.key_count, r.stats.memory_usage,
                                   r.stats.get_operations_count,
                                   r.stats.put_operations_count,
                                   r.stats.delete_operations_count);
            } else if constexpr (std::is_same_v<T, CompactedResp>) {
                return fmt::format("COMPACTED {} {}\n", r.entries_before, r.entries_after);
            } else if constexpr (std::is_same_v<T, ErrorResp>) {
                return fmt::format("ERROR {} {}\n", r.status, r.message);
            }
        },
        response);
}

} // namespace zephyrite::network
