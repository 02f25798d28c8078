#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace zephyrite::network {

namespace {

unsigned int pool_size(unsigned int requested) {
    if (requested > 0) return requested;
    return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace

Server::Server(std::string host, std::uint16_t port, StorageEngine& storage,
               persistence::PersistentStorage* persistent, unsigned int threads)
    : host_(std::move(host)),
      port_(port),
      storage_(storage),
      persistent_(persistent),
      threads_(pool_size(threads)),
      ioc_(static_cast<int>(threads_)),
      acceptor_(ioc_) {
    const auto address = boost::asio::ip::make_address(host_);
    const boost::asio::ip::tcp::endpoint endpoint{address, port_};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("Server listening on {}:{}", host_, port_);
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);

    // Run the io_context across a thread pool.
    std::vector<std::thread> pool;
    pool.reserve(threads_ - 1);
    for (unsigned int i = 1; i < threads_; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, all threads joined");
}

void Server::stop() {
    // The acceptor is only touched from io_context threads.
    boost::asio::post(ioc_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        ioc_.stop();
    });
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::info("Server: accept loop started");

    constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

    for (;;) {
        auto [ec, socket] = co_await acceptor_.async_accept(use_awaitable);

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Server: accept error: {}", ec.message());
            }
            break; // Acceptor was closed – time to stop.
        }

        // Disable Nagle – send responses immediately.
        boost::system::error_code opt_ec;
        socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
        if (opt_ec) {
            spdlog::debug("Server: failed to set TCP_NODELAY: {}", opt_ec.message());
        }

        auto session = std::make_shared<Session>(std::move(socket), storage_, persistent_);
        boost::asio::co_spawn(
            ioc_,
            [sp = std::move(session)]() -> boost::asio::awaitable<void> {
                co_await sp->run();
            },
            boost::asio::detached);
    }

    spdlog::info("Server: accept loop exited");
}

} // namespace zephyrite::network
