#include "network/session.hpp"

#include "persistence/persistent_storage.hpp"
#include "storage/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <type_traits>
#include <utility>

namespace zephyrite::network {

namespace {
constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

// Longest line accepted before the connection is dropped: a maximal key and
// value plus the verb and separators.
constexpr std::size_t kMaxLineLength = 2 * 1024 * 1024;
} // namespace

// ── execute_command ───────────────────────────────────────────────────────────

Response execute_command(const Command& cmd, StorageEngine& storage,
                         persistence::PersistentStorage* persistent) {
    try {
        return std::visit(
            [&](const auto& c) -> Response {
                using T = std::decay_t<decltype(c)>;

                if constexpr (std::is_same_v<T, PingCmd>) {
                    return PongResp{};

                } else if constexpr (std::is_same_v<T, GetCmd>) {
                    try {
                        return ValueResp{storage.get(c.key).content};
                    } catch (const StorageError& e) {
                        if (e.kind() != StorageErrorKind::KeyNotFound) throw;
                        return NotFoundResp{};
                    }

                } else if constexpr (std::is_same_v<T, SetCmd>) {
                    if (storage.put(c.key, c.value)) return CreatedResp{};
                    return UpdatedResp{};

                } else if constexpr (std::is_same_v<T, DelCmd>) {
                    if (storage.del(c.key)) return DeletedResp{};
                    return NotFoundResp{};

                } else if constexpr (std::is_same_v<T, ExistsCmd>) {
                    return BoolResp{storage.exists(c.key)};

                } else if constexpr (std::is_same_v<T, SizeCmd>) {
                    try {
                        return SizeResp{storage.size_of_value(c.key)};
                    } catch (const StorageError& e) {
                        if (e.kind() != StorageErrorKind::KeyNotFound) throw;
                        return NotFoundResp{};
                    }

                } else if constexpr (std::is_same_v<T, KeysCmd>) {
                    return KeysResp{storage.keys()};

                } else if constexpr (std::is_same_v<T, StatsCmd>) {
                    return StatsResp{storage.stats()};

                } else if constexpr (std::is_same_v<T, ClearCmd>) {
                    storage.clear();
                    return OkResp{};

                } else if constexpr (std::is_same_v<T, CompactCmd>) {
                    if (persistent == nullptr) {
                        throw StorageError::unsupported("COMPACT requires persistent storage");
                    }
                    auto result = persistent->compact();
                    return CompactedResp{result.entries_before, result.entries_after};
                }
            },
            cmd);
    } catch (const StorageError& e) {
        return ErrorResp{e.status_code(), e.what()};
    }
}

// ── Session ───────────────────────────────────────────────────────────────────

Session::Session(boost::asio::ip::tcp::socket socket, StorageEngine& storage,
                 persistence::PersistentStorage* persistent)
    : socket_(std::move(socket)), storage_(storage), persistent_(persistent) {}

boost::asio::awaitable<void> Session::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = socket_.remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    spdlog::debug("Session: client connected from {}", remote);

    std::string buf;
    buf.reserve(256);

    for (;;) {
        // Read one newline-delimited line.
        auto [ec, n] = co_await boost::asio::async_read_until(
            socket_, boost::asio::dynamic_buffer(buf, kMaxLineLength), '\n', use_awaitable);

        if (ec) {
            if (ec == boost::asio::error::not_found) {
                spdlog::warn("Session {}: line exceeds {} bytes, closing", remote, kMaxLineLength);
            } else if (ec != boost::asio::error::eof &&
                       ec != boost::asio::error::connection_reset) {
                spdlog::warn("Session {}: read error: {}", remote, ec.message());
            }
            break;
        }

        std::string line = buf.substr(0, n - 1); // strip the '\n'
        buf.erase(0, n);

        spdlog::debug("Session {}: recv '{}'", remote, line);

        auto parsed = parse_command(line);
        Response response = std::holds_alternative<ErrorResp>(parsed)
            ? Response{std::get<ErrorResp>(std::move(parsed))}
            : execute_command(std::get<Command>(parsed), storage_, persistent_);

        const std::string wire = serialize_response(response);
        spdlog::debug("Session {}: send '{}'", remote, wire.substr(0, wire.size() - 1));

        auto [wec, _] = co_await boost::asio::async_write(
            socket_, boost::asio::buffer(wire), use_awaitable);

        if (wec) {
            spdlog::warn("Session {}: write error: {}", remote, wec.message());
            break;
        }
    }

    spdlog::debug("Session: client disconnected: {}", remote);
}

} // namespace zephyrite::network
