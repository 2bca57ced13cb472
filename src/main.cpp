/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief `kittyd` entry point.
 *
 * @details
 * Startup sequence:
 * 1. Argument parsing and configuration loading.
 * 2. Signal handler registration (SIGINT/SIGTERM, interrupting a blocked read).
 * 3. Storage bootstrap (log replay or in-memory store).
 * 4. Runtime assembly: chain, randomness, event log, pallet, dispatcher.
 * 5. Request loop: one JSON request per stdin line, one JSON response per stdout line.
 */

#include "kitties/infra/config.hpp"
#include "kitties/infra/logger.hpp"
#include "kitties/infra/shutdown.hpp"
#include "kitties/infra/string.hpp"
#include "kitties/network/dispatcher.hpp"
#include "kitties/runtime/chain.hpp"
#include "kitties/runtime/event_log.hpp"
#include "kitties/runtime/pallet.hpp"
#include "kitties/storage/kv_store.hpp"
#include "kitties/storage/log_store.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

/// @brief Log frames beyond which the store is compacted at startup.
constexpr size_t kCompactionThreshold = 1000;

} // namespace

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [CONFIG_PATH]\n"
              << "Reads one JSON request per line on stdin and answers on stdout.\n"
              << "Options:\n"
              << "  CONFIG_PATH   JSON configuration file (Default: built-in settings)\n"
              << "  --help        Show this help message\n"
              << "Example:\n"
              << "  {\"call\":\"create_kitty\",\"origin\":{\"signed\":\"alice\"}}\n";
}

int main(int argc, char* argv[])
{
    using kitties::infra::Logger;
    using kitties::infra::LogLevel;

    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    try {
        kitties::infra::Shutdown::install();

        kitties::infra::Config cfg;
        if (argc > 1)
            cfg = kitties::infra::Config::load(argv[1]);
        Logger::set_level(cfg.log_level);

        Logger::log(LogLevel::INFO, "System: Booting kittyd...");
        Logger::log(LogLevel::INFO, "Config: Max kitties per owner " +
                                        std::to_string(cfg.max_kitties_owned));

        std::unique_ptr<kitties::storage::KvStore> store;
        if (cfg.storage == kitties::infra::StorageKind::LOG) {
            Logger::log(LogLevel::INFO, "Config: Persistence path set to '" + cfg.data_dir + "'");
            auto log_store = std::make_unique<kitties::storage::LogStore>(cfg.data_dir);
            log_store->open();
            if (log_store->frame_count() > kCompactionThreshold) {
                Logger::log(LogLevel::INFO, "Maintenance: Auto-compacting " + log_store->path());
                if (!log_store->compact())
                    Logger::log(LogLevel::WARN, "Maintenance: Compaction skipped, log kept as is");
            }
            store = std::move(log_store);
        } else {
            Logger::log(LogLevel::WARN, "Config: Volatile storage, state is lost on exit");
            store = std::make_unique<kitties::storage::MemoryStore>();
        }

        kitties::runtime::Chain chain;
        chain.attach(*store);
        kitties::runtime::CollectiveFlip randomness(chain);
        kitties::runtime::EventLog events;

        kitties::runtime::PalletConfig pallet_cfg{cfg.max_kitties_owned, randomness, events};
        kitties::runtime::Pallet pallet(pallet_cfg, chain, *store);
        kitties::network::Dispatcher dispatcher(pallet, chain, events);

        Logger::log(LogLevel::INFO, "System: Ready at block #" +
                                        std::to_string(chain.block_number()) + ", " +
                                        std::to_string(pallet.registry().count_for_kitties()) +
                                        " kitties.");

        std::string line;
        while (!kitties::infra::Shutdown::requested() && std::getline(std::cin, line)) {
            std::string request = kitties::infra::String::trim(line);
            if (request.empty())
                continue;
            std::cout << dispatcher.process(request) << std::endl;
        }

        // Seal a partly built block so its extrinsics count toward the saved head.
        if (chain.extrinsic_count() > 0 && !chain.seal_block()) {
            Logger::log(LogLevel::WARN, "System: Open block was not sealed before exit");
        }

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
