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
 * @file config.hpp
 * @brief Node configuration loaded from a JSON document.
 *
 * @details
 * Example file:
 * @code
 * {
 *   "data_dir": "/var/lib/kitties",
 *   "storage": "log",
 *   "max_kitties_owned": 100,
 *   "log_level": "debug"
 * }
 * @endcode
 * Every key is optional. Unknown keys are ignored so newer files still load.
 */

#pragma once

#include "kitties/infra/logger.hpp"

#include <cstdint>
#include <string>

namespace kitties::infra {

/**
 * @enum StorageKind
 * @brief Selects the key-value backend beneath the registry.
 */
enum class StorageKind {
    MEMORY, ///< Volatile ordered map. State is lost on exit.
    LOG     ///< Append-only log under `data_dir`, replayed on startup.
};

/**
 * @struct Config
 * @brief Resolved runtime settings for `kittyd`.
 */
struct Config {
    std::string data_dir = "./kitties_data";
    StorageKind storage = StorageKind::LOG;
    uint32_t max_kitties_owned = 100;
    LogLevel log_level = LogLevel::INFO;

    /**
     * @brief Parses a JSON document into a configuration.
     *
     * @param json The raw document text.
     * @return Config Defaults overlaid with the keys present in `json`.
     *
     * @throws std::runtime_error If `json` is not a JSON object, or a known key
     * has the wrong type or an out-of-range value.
     */
    static Config parse(const std::string& json);

    /**
     * @brief Reads and parses a configuration file.
     *
     * @throws std::runtime_error If the file cannot be read or fails `parse`.
     */
    static Config load(const std::string& path);
};

} // namespace kitties::infra
