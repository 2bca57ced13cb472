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

#include "kitties/runtime/types.hpp"

#include "kitties/infra/string.hpp"

#include <algorithm>

namespace kitties::runtime {

std::string dna_bytes(const Dna& dna)
{
    return std::string(reinterpret_cast<const char*>(dna.data()), dna.size());
}

std::string dna_hex(const Dna& dna)
{
    return infra::String::to_hex(dna_bytes(dna));
}

bool parse_dna(const std::string& hex, Dna& out)
{
    std::string raw;
    if (!infra::String::from_hex(hex, raw) || raw.size() != out.size())
        return false;
    std::copy(raw.begin(), raw.end(), out.begin());
    return true;
}

const char* gender_name(Gender gender)
{
    return gender == Gender::Male ? "Male" : "Female";
}

std::optional<AccountId> ensure_signed(const Origin& origin)
{
    if (origin.kind != Origin::Kind::SIGNED || origin.account.empty())
        return std::nullopt;
    return origin.account;
}

const char* error_name(Error error)
{
    switch (error) {
    case Error::None:
        return "None";
    case Error::UnauthenticatedOrigin:
        return "UnauthenticatedOrigin";
    case Error::DuplicateKey:
        return "DuplicateKey";
    case Error::CounterOverflow:
        return "CounterOverflow";
    case Error::OwnerCapacityExceeded:
        return "OwnerCapacityExceeded";
    case Error::StorageFailure:
        return "StorageFailure";
    }
    return "Unknown";
}

} // namespace kitties::runtime
