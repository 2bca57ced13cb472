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
 * @file id_generator.cpp
 * @brief Implementation of the DNA derivation.
 */

#include "kitties/runtime/id_generator.hpp"

#include "kitties/infra/codec.hpp"
#include "kitties/infra/logger.hpp"

namespace kitties::runtime {

Gender IdGenerator::gender_of(const Dna& dna)
{
    return (dna[0] % 2 == 0) ? Gender::Male : Gender::Female;
}

GeneratedId IdGenerator::derive(const infra::Hash256& seed, uint32_t extrinsic_index,
                                uint64_t block_number)
{
    std::string payload(reinterpret_cast<const char*>(seed.data()), seed.size());
    infra::Codec::put_u32_le(payload, extrinsic_index);
    infra::Codec::put_u64_le(payload, block_number);

    GeneratedId id;
    id.dna = infra::Hasher::blake2_128(payload);
    id.gender = gender_of(id.dna);
    return id;
}

GeneratedId IdGenerator::generate(const Randomness& randomness, const ExecutionContext& context)
{
    RandomOutput random = randomness.random(kSubject);
    uint32_t index = context.extrinsic_index().value_or(0);
    uint64_t block = context.block_number();

    GeneratedId id = derive(random.seed, index, block);
    infra::Logger::log(infra::LogLevel::TRACE,
                       "Pallet: Derived DNA " + dna_hex(id.dna) + " at block " +
                           std::to_string(block) + ", extrinsic " + std::to_string(index));
    return id;
}

} // namespace kitties::runtime
