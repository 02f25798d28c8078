#include "common/config.hpp"
#include "common/logger.hpp"
#include "network/server.hpp"
#include "persistence/persistent_storage.hpp"
#include "storage/error.hpp"
#include "storage/storage_factory.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    zephyrite::ServerConfig cfg;
    try {
        cfg = zephyrite::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = zephyrite::parse_log_level(cfg.log_level);
    zephyrite::init_default_logger(level);
    auto logger = zephyrite::make_logger("server", level);

    logger->info("zephyrite-server {} starting – {}:{} storage={}",
        ZEPHYRITE_VERSION, cfg.host, cfg.port, zephyrite::to_string(cfg.storage.kind));

    // ── Storage ──────────────────────────────────────────────────────────────
    std::unique_ptr<zephyrite::StorageEngine> storage;
    try {
        storage = zephyrite::make_storage(cfg.storage);
    } catch (const zephyrite::StorageError& e) {
        logger->error("Failed to initialise storage: {}", e.what());
        return 1;
    }

    auto* persistent = dynamic_cast<zephyrite::persistence::PersistentStorage*>(storage.get());
    if (persistent) {
        const auto& rec = persistent->recovery_stats();
        logger->info("Recovered {} of {} WAL entries ({} failed), {} keys live",
                     rec.recovered, rec.entries_read, rec.failed, storage->stats().key_count);
    }

    // ── Network ──────────────────────────────────────────────────────────────
    try {
        zephyrite::network::Server server{cfg.host, cfg.port, *storage, persistent};
        server.run();
    } catch (const std::exception& e) {
        logger->error("Server error: {}", e.what());
        return 1;
    }

    logger->info("zephyrite-server stopped");
    return 0;
}
