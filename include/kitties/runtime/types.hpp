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
 * @file types.hpp
 * @brief Domain vocabulary shared by the registry, the pallet and the dispatcher.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kitties::runtime {

/// @brief Opaque identity of a signing account.
using AccountId = std::string;

/// @brief Monetary amount in the chain's smallest unit.
using Balance = uint64_t;

/// @brief 16-byte kitty identifier; the registry's primary key.
using Dna = std::array<uint8_t, 16>;

/// @brief Lowercase hex rendering of a DNA, for logs and wire responses.
std::string dna_hex(const Dna& dna);

/// @brief Parses 32 hex digits (optional `0x`) into a DNA.
bool parse_dna(const std::string& hex, Dna& out);

/// @brief Raw 16-byte string form of a DNA, used inside storage keys.
std::string dna_bytes(const Dna& dna);

enum class Gender { Male, Female };

const char* gender_name(Gender gender);

/**
 * @struct Kitty
 * @brief A minted record. Immutable once committed.
 */
struct Kitty {
    Dna dna{};
    /// @brief Absent means "not for sale". Nothing in this module sets it.
    std::optional<Balance> price;
    Gender gender = Gender::Male;
    AccountId owner;

    bool operator==(const Kitty& other) const
    {
        return dna == other.dna && price == other.price && gender == other.gender &&
               owner == other.owner;
    }
};

/**
 * @struct Origin
 * @brief The caller of a dispatched call as seen by the runtime.
 *
 * Only `SIGNED` origins resolve to an account. `ROOT` and `NONE` carry no
 * signing identity.
 */
struct Origin {
    enum class Kind { NONE, ROOT, SIGNED };

    Kind kind = Kind::NONE;
    AccountId account;

    static Origin none() { return Origin{}; }
    static Origin root() { return Origin{Kind::ROOT, {}}; }
    static Origin signed_by(AccountId who) { return Origin{Kind::SIGNED, std::move(who)}; }
};

/**
 * @brief Resolves an origin to its single signing account.
 *
 * @return The account, or `std::nullopt` for root, unsigned and empty-account origins.
 */
std::optional<AccountId> ensure_signed(const Origin& origin);

/**
 * @enum Error
 * @brief Reasons a dispatched call can fail. Every failure leaves state untouched.
 */
enum class Error {
    None,                  ///< Success.
    UnauthenticatedOrigin, ///< Caller did not resolve to one signing account.
    DuplicateKey,          ///< Generated DNA already exists.
    CounterOverflow,       ///< Kitty counter is at its maximum.
    OwnerCapacityExceeded, ///< Owner already holds the configured maximum.
    StorageFailure         ///< Backing store rejected the atomic commit.
};

/// @brief Stable name of an error, used in logs and wire responses.
const char* error_name(Error error);

/**
 * @struct DispatchResult
 * @brief Outcome of a registry mutation or a dispatched call.
 */
struct DispatchResult {
    Error error = Error::None;
    Dna dna{};

    bool ok() const { return error == Error::None; }

    static DispatchResult success(const Dna& dna) { return DispatchResult{Error::None, dna}; }
    static DispatchResult failure(Error error) { return DispatchResult{error, Dna{}}; }
};

/**
 * @struct Event
 * @brief Notification deposited after a successful call.
 */
struct Event {
    enum class Kind { Created };

    Kind kind = Kind::Created;
    Dna kitty{};
    AccountId owner;

    static Event created(const Dna& kitty, AccountId owner)
    {
        return Event{Kind::Created, kitty, std::move(owner)};
    }

    bool operator==(const Event& other) const
    {
        return kind == other.kind && kitty == other.kitty && owner == other.owner;
    }
};

} // namespace kitties::runtime
