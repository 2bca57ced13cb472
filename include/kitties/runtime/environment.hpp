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
 * @file environment.hpp
 * @brief Services the surrounding ledger provides to the kitties pallet.
 *
 * @details
 * The pallet never reaches for globals. Block context, entropy and the event
 * channel are injected through these interfaces, so tests can substitute
 * deterministic doubles and a node can plug in its own block machinery.
 */

#pragma once

#include "kitties/infra/hasher.hpp"
#include "kitties/runtime/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace kitties::runtime {

/**
 * @class ExecutionContext
 * @brief Read access to the block currently being built.
 */
class ExecutionContext {
  public:
    virtual ~ExecutionContext() = default;

    /// @brief Height of the block being built.
    virtual uint64_t block_number() const = 0;

    /// @brief Position of the call being applied within the block, if any.
    virtual std::optional<uint32_t> extrinsic_index() const = 0;
};

/**
 * @struct RandomOutput
 * @brief Entropy plus the block from which it became unpredictable.
 */
struct RandomOutput {
    infra::Hash256 seed{};
    uint64_t block_marker = 0;
};

/**
 * @class Randomness
 * @brief Deterministic, block-scoped entropy keyed by a domain tag.
 *
 * The same subject in the same block yields the same output, which is what
 * lets other nodes re-derive a minted DNA on replay.
 */
class Randomness {
  public:
    virtual ~Randomness() = default;
    virtual RandomOutput random(const std::string& subject) const = 0;
};

/**
 * @class EventSink
 * @brief Fire-and-forget channel for runtime events.
 */
class EventSink {
  public:
    virtual ~EventSink() = default;
    virtual void deposit(const Event& event) = 0;
};

} // namespace kitties::runtime
