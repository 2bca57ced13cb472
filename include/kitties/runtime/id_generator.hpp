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
 * @file id_generator.hpp
 * @brief Derivation of kitty DNA and gender from block-scoped entropy.
 *
 * @details
 * Unlike a random UUID, a kitty's DNA must be reproducible by every node that
 * replays the block. `IdGenerator` therefore uses only inputs fixed by the
 * execution context: the entropy for the `"dna"` subject, the extrinsic index
 * and the block number.
 */

#pragma once

#include "kitties/infra/hasher.hpp"
#include "kitties/runtime/environment.hpp"
#include "kitties/runtime/types.hpp"

#include <cstdint>
#include <string>

namespace kitties::runtime {

/**
 * @struct GeneratedId
 * @brief A freshly derived DNA and the gender read from it.
 */
struct GeneratedId {
    Dna dna{};
    Gender gender = Gender::Male;
};

/**
 * @class IdGenerator
 * @brief A static utility deriving kitty identities.
 */
class IdGenerator {
  public:
    /// @brief Domain tag under which entropy is requested.
    static constexpr const char* kSubject = "dna";

    /**
     * @brief Derives an identity from explicit inputs.
     *
     * **Payload layout** (44 bytes, little-endian integers):
     * - entropy seed (32 bytes)
     * - extrinsic index (u32, 0 when absent)
     * - block number (u64)
     *
     * The DNA is the 128-bit digest of the payload. The gender is `Male` when
     * the first DNA byte is even and `Female` when it is odd.
     *
     * @code
     * auto id = kitties::runtime::IdGenerator::derive(seed, 0, 42);
     * @endcode
     */
    static GeneratedId derive(const infra::Hash256& seed, uint32_t extrinsic_index,
                              uint64_t block_number);

    /**
     * @brief Derives an identity for the call currently being applied.
     *
     * Two mints in the same block differ because their extrinsic index differs.
     * Actual uniqueness is still checked by the registry.
     */
    static GeneratedId generate(const Randomness& randomness, const ExecutionContext& context);

    /// @brief Gender encoded by a DNA.
    static Gender gender_of(const Dna& dna);
};

} // namespace kitties::runtime
