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
 * @file log_store.cpp
 * @brief Implementation of the append-only log backend.
 *
 * @details
 * Frame format: `[4-byte Little Endian Length Header] + [N-byte JSON Payload]`.
 * The length is encoded byte by byte, so log files move between hosts of
 * either endianness.
 */

#include "kitties/storage/log_store.hpp"

#include "kitties/infra/codec.hpp"
#include "kitties/infra/logger.hpp"
#include "kitties/infra/string.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace kitties::storage {

LogStore::LogStore(std::string base_path)
    : base_path_(std::move(base_path)), path_(base_path_ + "/state.kv")
{
}

/**
 * @brief Replays the log into the in-memory view.
 *
 * Reader loop:
 * 1. **Header Read:** 4 bytes giving the payload size, bounded by the bytes left.
 * 2. **Body Read:** exactly that many bytes.
 * 3. **Apply:** decode the batch and commit it to the view.
 *
 * The byte offset after the last applied frame is remembered; anything past
 * it is a torn write and is truncated away. Frames carry whole values, not
 * deltas, so an undecodable frame with later frames behind it is fatal.
 */
void LogStore::open()
{
    if (!fs::exists(base_path_)) {
        fs::create_directories(base_path_);
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Storage: No log at " + path_ + ", starting empty.");
        return;
    }

    const uint64_t file_size = fs::file_size(path_);
    uint64_t good_end = 0;
    while (file.peek() != EOF) {
        unsigned char header[4];
        file.read(reinterpret_cast<char*>(header), sizeof(header));
        if (file.gcount() < static_cast<std::streamsize>(sizeof(header))) {
            break;
        }
        uint32_t payload_length = static_cast<uint32_t>(header[0]) |
                                  (static_cast<uint32_t>(header[1]) << 8) |
                                  (static_cast<uint32_t>(header[2]) << 16) |
                                  (static_cast<uint32_t>(header[3]) << 24);

        // A length past the end of the file is a torn or garbled header.
        uint64_t remaining = file_size - good_end - sizeof(header);
        if (payload_length > remaining) {
            break;
        }

        std::string buffer;
        buffer.resize(payload_length);
        file.read(&buffer[0], payload_length);
        if (file.gcount() != static_cast<std::streamsize>(payload_length)) {
            break;
        }

        uint64_t frame_end = good_end + sizeof(header) + payload_length;
        WriteBatch batch;
        if (!decode_frame(buffer, batch)) {
            if (frame_end < file_size) {
                throw std::runtime_error("Storage: Corrupt frame #" +
                                         std::to_string(frame_count_ + 1) + " in " + path_ +
                                         " is followed by later frames");
            }
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Storage: Undecodable trailing frame #" +
                                   std::to_string(frame_count_ + 1) + " in " + path_ + ".");
            break;
        }

        view_.commit(batch);
        good_end = frame_end;
        frame_count_++;
    }
    file.close();

    if (fs::file_size(path_) > good_end) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Storage: Discarding torn trailing frame in " + path_);
        fs::resize_file(path_, good_end);
    }

    infra::Logger::log(infra::LogLevel::INFO, "Storage: Replayed " + std::to_string(frame_count_) +
                                                  " frames, " + std::to_string(view_.size()) +
                                                  " keys.");
}

std::optional<std::string> LogStore::get(const std::string& key) const
{
    return view_.get(key);
}

bool LogStore::contains(const std::string& key) const
{
    return view_.contains(key);
}

bool LogStore::commit(const WriteBatch& batch)
{
    if (batch.empty()) {
        return true;
    }

    std::string frame = encode_frame(batch.writes());
    if (frame.empty()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Storage: Could not serialize batch for " + path_);
        return false;
    }
    uint64_t previous_size = fs::exists(path_) ? fs::file_size(path_) : 0;

    bool ok = false;
    {
        std::ofstream file(path_, std::ios::binary | std::ios::app);
        if (file.is_open()) {
            file.write(frame.data(), static_cast<std::streamsize>(frame.size()));
            file.flush();
            ok = file.good();
        }
    }

    if (!ok) {
        infra::Logger::log(infra::LogLevel::ERROR, "Storage: Append failed on " + path_);
        std::error_code ec;
        if (fs::exists(path_, ec) && fs::file_size(path_, ec) > previous_size) {
            fs::resize_file(path_, previous_size, ec);
        }
        return false;
    }

    view_.commit(batch);
    frame_count_++;
    infra::Logger::log(infra::LogLevel::TRACE,
                       "Storage: Committed " + std::to_string(batch.size()) + " writes.");
    return true;
}

/**
 * @brief Atomic compaction of the log file.
 *
 * 1. **Snapshot:** one frame with every live key goes to a temporary file.
 * 2. **Flush:** the temporary file is closed and checked.
 * 3. **Atomic Swap:** `fs::rename` replaces the old log.
 */
bool LogStore::compact()
{
    std::string temp_path = path_ + ".tmp";
    auto entries = view_.snapshot();
    std::vector<std::pair<std::string, std::string>> writes(entries.begin(), entries.end());

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    if (!writes.empty()) {
        std::string frame = encode_frame(writes);
        if (frame.empty()) {
            file.close();
            fs::remove(temp_path);
            infra::Logger::log(infra::LogLevel::ERROR, "Storage: Compaction failed for " + path_);
            return false;
        }
        file.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    }
    file.flush();
    file.close();

    if (file.fail()) {
        fs::remove(temp_path);
        infra::Logger::log(infra::LogLevel::ERROR, "Storage: Compaction failed for " + path_);
        return false;
    }

    try {
        fs::rename(temp_path, path_);
    } catch (const fs::filesystem_error& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Storage: Compaction swap failed: " + std::string(e.what()));
        return false;
    }

    frame_count_ = writes.empty() ? 0 : 1;
    infra::Logger::log(infra::LogLevel::DEBUG, "Storage: Compaction complete for " + path_);
    return true;
}

std::string LogStore::encode_frame(const std::vector<std::pair<std::string, std::string>>& writes)
{
    cJSON* arr = cJSON_CreateArray();
    for (const auto& [key, value] : writes) {
        cJSON* op = cJSON_CreateObject();
        cJSON_AddStringToObject(op, "k", infra::String::to_hex(key).c_str());
        cJSON_AddStringToObject(op, "v", infra::String::to_hex(value).c_str());
        cJSON_AddItemToArray(arr, op);
    }

    char* raw = cJSON_PrintUnformatted(arr);
    cJSON_Delete(arr);
    if (!raw) {
        return "";
    }
    std::string payload(raw);
    free(raw);

    std::string frame;
    infra::Codec::put_u32_le(frame, static_cast<uint32_t>(payload.size()));
    frame += payload;
    return frame;
}

bool LogStore::decode_frame(const std::string& payload, WriteBatch& out)
{
    cJSON* arr = cJSON_Parse(payload.c_str());
    if (!cJSON_IsArray(arr)) {
        cJSON_Delete(arr);
        return false;
    }

    WriteBatch batch;
    bool ok = true;
    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, arr)
    {
        cJSON* k = cJSON_GetObjectItem(item, "k");
        cJSON* v = cJSON_GetObjectItem(item, "v");
        std::string key, value;
        if (!cJSON_IsString(k) || !cJSON_IsString(v) ||
            !infra::String::from_hex(k->valuestring, key) ||
            !infra::String::from_hex(v->valuestring, value)) {
            ok = false;
            break;
        }
        batch.put(std::move(key), std::move(value));
    }
    cJSON_Delete(arr);

    if (ok) {
        out = std::move(batch);
    }
    return ok;
}

} // namespace kitties::storage
