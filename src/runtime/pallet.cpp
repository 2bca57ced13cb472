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
 * @file pallet.cpp
 * @brief Implementation of the kitty creation call.
 */

#include "kitties/runtime/pallet.hpp"

#include "kitties/infra/logger.hpp"

namespace kitties::runtime {

Pallet::Pallet(const PalletConfig& config, const ExecutionContext& context,
               storage::KvStore& store)
    : randomness_(config.randomness), events_(config.events), context_(context),
      registry_(store, config.max_kitties_owned)
{
}

DispatchResult Pallet::create_kitty(const Origin& origin)
{
    auto sender = ensure_signed(origin);
    if (!sender) {
        infra::Logger::log(infra::LogLevel::WARN, "Pallet: create_kitty from unsigned origin");
        return DispatchResult::failure(Error::UnauthenticatedOrigin);
    }

    GeneratedId id = IdGenerator::generate(randomness_, context_);
    return mint(*sender, id.dna, id.gender);
}

DispatchResult Pallet::mint(const AccountId& owner, const Dna& dna, Gender gender)
{
    DispatchResult result = registry_.mint(owner, dna, gender);
    if (!result.ok()) {
        return result;
    }

    events_.deposit(Event::created(dna, owner));
    return result;
}

} // namespace kitties::runtime
