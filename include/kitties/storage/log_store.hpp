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
 * @file log_store.hpp
 * @brief Durable `KvStore` built on an append-only log.
 *
 * @details
 * Every committed `WriteBatch` becomes exactly one frame at the end of
 * `<base_path>/state.kv`:
 *
 * `[4-byte Little Endian Length] + [N-byte JSON payload]`
 *
 * The payload is a JSON array of `{"k": <hex key>, "v": <hex value>}` objects.
 * Because a batch never spans frames, a crash in the middle of a write leaves a
 * truncated trailing frame that replay discards, so a torn commit never
 * becomes visible.
 */

#pragma once

#include "kitties/storage/kv_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kitties::storage {

/**
 * @class LogStore
 * @brief Replays the log into memory on `open()` and appends one frame per commit.
 */
class LogStore : public KvStore {
  public:
    /**
     * @param base_path Directory holding the `state.kv` log.
     */
    explicit LogStore(std::string base_path);

    /**
     * @brief Creates the directory if needed and replays the existing log.
     *
     * A short or undecodable trailing frame is cut off the file so later
     * appends start on a frame boundary.
     *
     * @throws std::runtime_error If an undecodable frame is followed by more data.
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    void open();

    std::optional<std::string> get(const std::string& key) const override;
    bool contains(const std::string& key) const override;

    /**
     * @brief Appends `batch` as one frame, then applies it in memory.
     *
     * If the append fails the file is truncated back to its previous length
     * and the in-memory view is left untouched.
     */
    bool commit(const WriteBatch& batch) override;

    /**
     * @brief Rewrites the log as a single frame holding the current state.
     *
     * Writes a temporary file and renames it over the log.
     *
     * @return true If the new log replaced the old one.
     */
    bool compact();

    /// @brief Number of frames in the log file.
    size_t frame_count() const { return frame_count_; }

    /// @brief Absolute path of the log file.
    const std::string& path() const { return path_; }

  private:
    std::string base_path_;
    std::string path_;
    MemoryStore view_;
    size_t frame_count_ = 0;

    /// @brief Length-prefixed frame for `writes`, or empty if serialization fails.
    static std::string encode_frame(const std::vector<std::pair<std::string, std::string>>& writes);
    static bool decode_frame(const std::string& payload, WriteBatch& out);
};

} // namespace kitties::storage
