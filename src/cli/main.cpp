#include "common/logger.hpp"
#include "network/protocol.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/program_options.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace po = boost::program_options;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);

// Sends one request line and returns the response line without its '\n',
// or nullopt if the connection failed.
asio::awaitable<std::optional<std::string>> round_trip(tcp::socket& socket,
                                                      std::string& recv_buf,
                                                      const std::string& line) {
    const std::string request = line + "\n";

    auto [wec, _] = co_await asio::async_write(
        socket, asio::buffer(request), use_awaitable);
    if (wec) {
        spdlog::error("zephyrite-cli: send error: {}", wec.message());
        co_return std::nullopt;
    }

    auto [rec, n] = co_await asio::async_read_until(
        socket, asio::dynamic_buffer(recv_buf), '\n', use_awaitable);
    if (rec) {
        if (rec == asio::error::eof) {
            fprintf(stdout, "Server disconnected.\n");
        } else {
            spdlog::error("zephyrite-cli: recv error: {}", rec.message());
        }
        co_return std::nullopt;
    }

    std::string response = recv_buf.substr(0, n - 1);
    recv_buf.erase(0, n);
    co_return response;
}

// Parses `line` locally so malformed commands never reach the server.
// Prints the error and returns false if the line is rejected.
bool check_command(const std::string& line) {
    auto parsed = zephyrite::network::parse_command(line);
    if (auto* err = std::get_if<zephyrite::network::ErrorResp>(&parsed)) {
        fprintf(stdout, "%s", zephyrite::network::serialize_response(*err).c_str());
        return false;
    }
    return true;
}

} // anonymous namespace

// ── Text REPL coroutine ───────────────────────────────────────────────────────

asio::awaitable<void> repl(tcp::socket socket) {
    std::string recv_buf;
    recv_buf.reserve(512);

    std::string line;
    while (true) {
        fprintf(stdout, "> ");
        fflush(stdout);

        if (!std::getline(std::cin, line)) {
            fprintf(stdout, "\n");
            break;
        }

        if (line.empty()) {
            continue;
        }
        if (line == "QUIT" || line == "EXIT") {
            break;
        }
        if (!check_command(line)) {
            continue;
        }

        auto response = co_await round_trip(socket, recv_buf, line);
        if (!response) break;
        fprintf(stdout, "%s\n", response->c_str());
    }
}

// ── One-shot coroutine ────────────────────────────────────────────────────────

asio::awaitable<void> one_shot(tcp::socket socket, std::string line, int& exit_code) {
    std::string recv_buf;
    auto response = co_await round_trip(socket, recv_buf, line);
    if (!response) {
        exit_code = 1;
        co_return;
    }
    fprintf(stdout, "%s\n", response->c_str());
    exit_code = response->starts_with("ERROR") ? 2 : 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    po::options_description desc("zephyrite-cli options");
    desc.add_options()
        ("help,h",                                                        "Show this help")
        ("host",   po::value<std::string>()->default_value("127.0.0.1"), "Server host")
        ("port,p", po::value<std::uint16_t>()->default_value(8080),      "Server port")
        ("log-level,l", po::value<std::string>()->default_value("warn"), "Log level")
        ("command", po::value<std::vector<std::string>>(),
            "Command to run once instead of starting the REPL, e.g. SET k v");

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        fprintf(stderr, "Argument error: %s\n", e.what());
        return 1;
    }

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        fprintf(stdout, "%s\n", oss.str().c_str());
        return 0;
    }

    const auto host      = vm["host"].as<std::string>();
    const auto port      = vm["port"].as<std::uint16_t>();
    const auto log_level = vm["log-level"].as<std::string>();

    std::optional<std::string> command;
    if (vm.count("command")) {
        std::string joined;
        for (const auto& word : vm["command"].as<std::vector<std::string>>()) {
            if (!joined.empty()) joined += ' ';
            joined += word;
        }
        command = std::move(joined);
    }

    zephyrite::init_default_logger(zephyrite::parse_log_level(log_level));

    if (command && !check_command(*command)) {
        return 2;
    }

    spdlog::debug("zephyrite-cli connecting to {}:{}", host, port);

    int exit_code = 0;
    try {
        asio::io_context ioc;
        tcp::resolver resolver{ioc};
        auto endpoints = resolver.resolve(host, std::to_string(port));

        tcp::socket socket{ioc};
        boost::system::error_code ec;
        asio::connect(socket, endpoints, ec);

        if (ec) {
            spdlog::error("zephyrite-cli: failed to connect to {}:{} – {}", host, port, ec.message());
            return 1;
        }

        socket.set_option(tcp::no_delay(true));

        if (command) {
            asio::co_spawn(ioc, one_shot(std::move(socket), *command, exit_code), asio::detached);
        } else {
            fprintf(stdout, "Connected to %s:%u. "
                    "Commands: PING, SET k v, GET k, DEL k, EXISTS k, SIZE k, KEYS, STATS, "
                    "CLEAR, COMPACT. Ctrl+D or QUIT to exit.\n",
                    host.c_str(), port);
            asio::co_spawn(ioc, repl(std::move(socket)), asio::detached);
        }
        ioc.run();

    } catch (const std::exception& ex) {
        spdlog::error("zephyrite-cli: exception: {}", ex.what());
        return 1;
    }

    return exit_code;
}
