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
 * @file kv_store.hpp
 * @brief Ordered key-value abstraction with atomic multi-key commit.
 *
 * @details
 * The registry never writes a single key on its own. It stages every write of a
 * transition in a `WriteBatch` and hands the batch to `KvStore::commit`, which
 * makes either all of the writes visible or none of them. Keys and values are
 * opaque byte strings.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kitties::storage {

/**
 * @class WriteBatch
 * @brief An ordered set of puts applied as one unit.
 *
 * Later puts to the same key win when the batch is applied.
 */
class WriteBatch {
  public:
    /// @brief Stages `value` under `key`.
    void put(std::string key, std::string value);

    /// @brief Staged writes in insertion order.
    const std::vector<std::pair<std::string, std::string>>& writes() const { return writes_; }

    bool empty() const { return writes_.empty(); }
    size_t size() const { return writes_.size(); }

  private:
    std::vector<std::pair<std::string, std::string>> writes_;
};

/**
 * @class KvStore
 * @brief Interface of the persisted state beneath the registry.
 *
 * @details
 * Implementations are driven by one transition at a time and need no internal
 * locking.
 */
class KvStore {
  public:
    virtual ~KvStore() = default;

    /// @brief Returns the value under `key`, or `std::nullopt` if absent.
    virtual std::optional<std::string> get(const std::string& key) const = 0;

    /// @brief Tests whether `key` has a value.
    virtual bool contains(const std::string& key) const = 0;

    /**
     * @brief Applies every write of `batch` atomically.
     *
     * @return false If the backend could not make the batch durable. In that
     * case none of the writes are visible through `get`.
     */
    virtual bool commit(const WriteBatch& batch) = 0;
};

/**
 * @class MemoryStore
 * @brief Volatile `KvStore` backed by an ordered map.
 */
class MemoryStore : public KvStore {
  public:
    std::optional<std::string> get(const std::string& key) const override;
    bool contains(const std::string& key) const override;
    bool commit(const WriteBatch& batch) override;

    /// @brief Copy of every entry, for byte-level comparisons.
    std::map<std::string, std::string> snapshot() const { return entries_; }

    size_t size() const { return entries_.size(); }

  private:
    std::map<std::string, std::string> entries_;
};

} // namespace kitties::storage
