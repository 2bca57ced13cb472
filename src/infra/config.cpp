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
 * @file config.cpp
 * @brief cJSON-based configuration loader.
 */

#include "kitties/infra/config.hpp"

#include <cJSON.h>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace kitties::infra {

Config Config::parse(const std::string& json)
{
    cJSON* root = cJSON_Parse(json.c_str());
    if (!root) {
        throw std::runtime_error("Config: Invalid JSON syntax");
    }
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        throw std::runtime_error("Config: Top-level value must be an object");
    }

    Config cfg;
    std::string problem;

    cJSON* dir = cJSON_GetObjectItem(root, "data_dir");
    if (dir) {
        if (cJSON_IsString(dir) && dir->valuestring && dir->valuestring[0] != '\0')
            cfg.data_dir = dir->valuestring;
        else
            problem = "'data_dir' must be a non-empty string";
    }

    cJSON* storage = cJSON_GetObjectItem(root, "storage");
    if (problem.empty() && storage) {
        std::string kind = cJSON_IsString(storage) ? storage->valuestring : "";
        if (kind == "memory")
            cfg.storage = StorageKind::MEMORY;
        else if (kind == "log")
            cfg.storage = StorageKind::LOG;
        else
            problem = "'storage' must be \"memory\" or \"log\"";
    }

    cJSON* max_owned = cJSON_GetObjectItem(root, "max_kitties_owned");
    if (problem.empty() && max_owned) {
        // cJSON keeps numbers as doubles; reject fractions and anything outside u32.
        double v = cJSON_IsNumber(max_owned) ? max_owned->valuedouble : -1.0;
        if (v < 0 || v > std::numeric_limits<uint32_t>::max() ||
            v != static_cast<double>(static_cast<uint32_t>(v)))
            problem = "'max_kitties_owned' must be an integer in [0, 4294967295]";
        else
            cfg.max_kitties_owned = static_cast<uint32_t>(v);
    }

    cJSON* level = cJSON_GetObjectItem(root, "log_level");
    if (problem.empty() && level) {
        if (!cJSON_IsString(level) || !Logger::parse_level(level->valuestring, cfg.log_level))
            problem = "'log_level' must be one of trace, debug, info, warn, error, fatal";
    }

    cJSON_Delete(root);

    if (!problem.empty()) {
        throw std::runtime_error("Config: " + problem);
    }
    return cfg;
}

Config Config::load(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Config: Cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Config cfg = parse(buffer.str());
    Logger::log(LogLevel::DEBUG, "Config: Loaded settings from '" + path + "'");
    return cfg;
}

} // namespace kitties::infra
