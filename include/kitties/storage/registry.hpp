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
 * @file registry.hpp
 * @brief Authoritative kitty state and its single mutating operation.
 *
 * @details
 * The `Registry` maps three logical storage items onto a `KvStore`:
 *
 * | Item             | Key                         | Value                        |
 * |------------------|-----------------------------|------------------------------|
 * | CountForKitties  | `CountForKitties`           | u64, little-endian           |
 * | Kitties          | `Kitties/` + 16-byte DNA    | JSON `{dna,price,gender,owner}` |
 * | KittiesOwned     | `KittiesOwned/` + account   | JSON array of hex DNAs       |
 *
 * All three are written in one `WriteBatch` per mint, so after every commit:
 * - the counter equals the number of kitties,
 * - every owned DNA resolves to a kitty owned by that account,
 * - no owner list is longer than `max_kitties_owned`.
 */

#pragma once

#include "kitties/runtime/types.hpp"
#include "kitties/storage/kv_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kitties::storage {

/**
 * @class Registry
 * @brief Typed accessors and the `mint` transition over a `KvStore`.
 *
 * @details
 * The registry does not own the store. Whoever instantiates the runtime owns
 * both and keeps the store alive for the registry's lifetime.
 */
class Registry {
  public:
    /**
     * @param store Backing key-value state.
     * @param max_kitties_owned Capacity of each owner's list.
     */
    Registry(KvStore& store, uint32_t max_kitties_owned);

    /**
     * @brief Creates and commits a new kitty for `owner`.
     *
     * Checks run in order and the first failure wins:
     * 1. `dna` already stored -> `Error::DuplicateKey`.
     * 2. counter at `UINT64_MAX` -> `Error::CounterOverflow`.
     * 3. owner list full -> `Error::OwnerCapacityExceeded`.
     *
     * On success the kitty (price absent), the extended owner list and the
     * incremented counter are committed together. A commit refused by the store
     * yields `Error::StorageFailure`. On any failure nothing is written.
     *
     * @return DispatchResult Carrying `dna` on success.
     */
    runtime::DispatchResult mint(const runtime::AccountId& owner, const runtime::Dna& dna,
                                 runtime::Gender gender);

    /// @brief Number of kitties in existence. Zero on an empty store.
    uint64_t count_for_kitties() const;

    /// @brief Looks up a kitty by DNA.
    std::optional<runtime::Kitty> kitty(const runtime::Dna& dna) const;

    /// @brief DNAs owned by `owner`, in mint order. Empty if none.
    std::vector<runtime::Dna> kitties_owned(const runtime::AccountId& owner) const;

    uint32_t max_kitties_owned() const { return max_kitties_owned_; }

    // --- Storage layout ---

    static std::string count_key();
    static std::string kitty_key(const runtime::Dna& dna);
    static std::string owned_key(const runtime::AccountId& owner);

    static std::string encode_count(uint64_t count);
    static std::string encode_kitty(const runtime::Kitty& kitty);
    static std::string encode_owned(const std::vector<runtime::Dna>& owned);

  private:
    KvStore& store_;
    uint32_t max_kitties_owned_;

    static bool decode_kitty(const std::string& raw, runtime::Kitty& out);
    static bool decode_owned(const std::string& raw, std::vector<runtime::Dna>& out);
};

} // namespace kitties::storage
