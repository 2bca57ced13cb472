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
 * @file pallet.hpp
 * @brief The externally callable kitties module.
 *
 * @details
 * `Pallet` composes origin resolution, DNA derivation and the registry mint
 * into the `create_kitty` call. Its collaborators are injected through
 * `PalletConfig`; the registry state it mutates is owned by the caller.
 */

#pragma once

#include "kitties/runtime/environment.hpp"
#include "kitties/runtime/id_generator.hpp"
#include "kitties/runtime/types.hpp"
#include "kitties/storage/registry.hpp"

#include <cstdint>

namespace kitties::runtime {

/**
 * @struct PalletConfig
 * @brief Construction-time bindings of the pallet.
 */
struct PalletConfig {
    /// @brief Maximum number of kitties a single account may own.
    uint32_t max_kitties_owned;
    /// @brief Entropy source for DNA derivation.
    const Randomness& randomness;
    /// @brief Destination of `Created` events.
    EventSink& events;
};

/**
 * @class Pallet
 * @brief Entry point for kitty creation.
 */
class Pallet {
  public:
    /**
     * @param config Injected collaborators. They must outlive the pallet.
     * @param context Block context of the call being applied.
     * @param store Registry state. Must outlive the pallet.
     */
    Pallet(const PalletConfig& config, const ExecutionContext& context, storage::KvStore& store);

    /**
     * @brief Creates a new kitty owned by the signer of `origin`.
     *
     * Steps: `ensure_signed` -> `IdGenerator::generate` -> `Registry::mint` ->
     * deposit `Created { kitty, owner }`. Registry errors are returned
     * unchanged; nothing is retried and no event is deposited on failure.
     *
     * @return DispatchResult Carrying the new DNA on success, or
     * `Error::UnauthenticatedOrigin` when `origin` has no single signer.
     */
    DispatchResult create_kitty(const Origin& origin);

    /**
     * @brief Everything `create_kitty` does after DNA derivation.
     *
     * Runs the registry checks for a caller-supplied DNA and deposits
     * `Created` on success.
     */
    DispatchResult mint(const AccountId& owner, const Dna& dna, Gender gender);

    /// @brief Read access to the registry state.
    const storage::Registry& registry() const { return registry_; }

  private:
    const Randomness& randomness_;
    EventSink& events_;
    const ExecutionContext& context_;
    storage::Registry registry_;
};

} // namespace kitties::runtime
