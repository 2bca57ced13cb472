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
 * @file chain.hpp
 * @brief Minimal block context: height, extrinsic position and recent block hashes.
 *
 * @details
 * `Chain` plays the part of the block author for `kittyd` and the tests. It
 * brackets every applied call with `begin_extrinsic()`/`end_extrinsic()` and
 * closes blocks with `seal_block()`. `CollectiveFlip` turns the recorded block
 * hashes into per-subject entropy.
 *
 * When attached to a store, the chain head lives under the `System/` keys and
 * survives restarts, so a restarted node does not derive the DNAs of earlier
 * blocks again.
 */

#pragma once

#include "kitties/infra/hasher.hpp"
#include "kitties/runtime/environment.hpp"
#include "kitties/storage/kv_store.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace kitties::runtime {

/**
 * @class Chain
 * @brief Serial block builder implementing `ExecutionContext`.
 */
class Chain : public ExecutionContext {
  public:
    /// @brief Maximum number of recent block hashes kept as random material.
    static constexpr size_t kRandomMaterialLen = 81;

    /**
     * @param first_block Height of the first block to build.
     */
    explicit Chain(uint64_t first_block = 1);

    /**
     * @brief Binds the chain to `store`.
     *
     * Restores the head saved by an earlier `seal_block()`, if any, and saves
     * the head on every later seal. The store must outlive the chain.
     *
     * @throws std::runtime_error If a saved head is malformed.
     */
    void attach(storage::KvStore& store);

    uint64_t block_number() const override { return block_number_; }
    std::optional<uint32_t> extrinsic_index() const override { return current_index_; }

    /// @brief Marks the start of the next call in the current block.
    void begin_extrinsic();

    /// @brief Marks the end of the current call, successful or not.
    void end_extrinsic();

    /// @brief Calls applied so far in the current block.
    uint32_t extrinsic_count() const { return extrinsic_count_; }

    /**
     * @brief Closes the current block and opens the next one.
     *
     * The block hash is BLAKE2b-256 over
     * `parent_hash || block_number (u64 LE) || extrinsic_count (u32 LE)`.
     * An attached chain saves the new head before adopting it.
     *
     * @return The hash of the sealed block, or `std::nullopt` if the head
     * could not be saved. The chain then stays on the current block.
     */
    std::optional<infra::Hash256> seal_block();

    /// @brief Hash of the last sealed block, all zero before the first seal.
    const infra::Hash256& parent_hash() const { return parent_hash_; }

    /// @brief Recent block hashes, oldest first.
    const std::deque<infra::Hash256>& random_material() const { return random_material_; }

  private:
    uint64_t block_number_;
    uint32_t extrinsic_count_ = 0;
    std::optional<uint32_t> current_index_;
    infra::Hash256 parent_hash_{};
    std::deque<infra::Hash256> random_material_;
    storage::KvStore* store_ = nullptr;

    bool save_head(uint64_t number, const infra::Hash256& parent,
                   const std::deque<infra::Hash256>& material);
};

/**
 * @class CollectiveFlip
 * @brief Low-influence randomness mixed from the recent block hashes.
 *
 * @details
 * The seed is BLAKE2b-256 over the subject followed by every hash in the
 * random material window, each prefixed by its one-byte position. Any single
 * block author controls only one of up to 81 inputs. With no sealed blocks the
 * seed is all zero.
 */
class CollectiveFlip : public Randomness {
  public:
    explicit CollectiveFlip(const Chain& chain);

    /**
     * @return The mixed seed and the block marker `block_number - 81`,
     * saturating at zero.
     */
    RandomOutput random(const std::string& subject) const override;

  private:
    const Chain& chain_;
};

} // namespace kitties::runtime
