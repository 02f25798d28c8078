#pragma once

#include "storage/storage_engine.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <string>

namespace zephyrite::persistence {
class PersistentStorage;
} // namespace zephyrite::persistence

namespace zephyrite::network {

// Owns the io_context and TCP acceptor.
//
// Usage:
//   Server srv{"127.0.0.1", 8080, storage};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Binds and listens immediately.  Port 0 picks an ephemeral port (see
    // port()).  `persistent` enables COMPACT; it must point at `storage` when
    // given.
    Server(std::string host, std::uint16_t port, StorageEngine& storage,
           persistence::PersistentStorage* persistent = nullptr,
           unsigned int threads = 0);

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Asks the server to stop; run() returns once the io_context drains.
    // Safe to call from any thread.
    void stop();

    // The port actually bound.
    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
    // Accept loop coroutine – runs until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    std::string host_;
    std::uint16_t port_;
    StorageEngine& storage_;
    persistence::PersistentStorage* persistent_ = nullptr;
    unsigned int threads_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace zephyrite::network
