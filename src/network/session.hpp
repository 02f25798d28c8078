#pragma once

#include "network/protocol.hpp"
#include "storage/storage_engine.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <string>

namespace zephyrite::persistence {
class PersistentStorage;
} // namespace zephyrite::persistence

namespace zephyrite::network {

// Execute a parsed Command against `storage`.  StorageError is mapped to
// ErrorResp carrying its status code and message.  COMPACT needs a
// persistent backend; pass nullptr when there is none.
//
// Thread-safe to the extent `storage` is.
[[nodiscard]] Response execute_command(const Command& cmd, StorageEngine& storage,
                                       persistence::PersistentStorage* persistent);

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned from Server::accept_loop() and runs until the
// client disconnects or an error occurs.  Storage calls are synchronous; the
// engine does its own locking.
class Session {
public:
    Session(boost::asio::ip::tcp::socket socket, StorageEngine& storage,
            persistence::PersistentStorage* persistent);

    // Main coroutine.  Loops reading newline-delimited commands, dispatching
    // to storage, and sending responses.  Returns when the connection closes.
    boost::asio::awaitable<void> run();

private:
    boost::asio::ip::tcp::socket socket_;
    StorageEngine& storage_;
    persistence::PersistentStorage* persistent_ = nullptr; // null for the memory backend
};

} // namespace zephyrite::network
