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
 * @file hasher.hpp
 * @brief BLAKE2b digests backed by OpenSSL's EVP interface.
 *
 * @details
 * The registry derives kitty DNA and block hashes from BLAKE2b. OpenSSL 3.0
 * exposes only the 512-bit variant, so the narrower digests are the leading
 * bytes of BLAKE2b-512 over the same input.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace kitties::infra {

/// @brief A 128-bit digest.
using Hash128 = std::array<uint8_t, 16>;

/// @brief A 256-bit digest.
using Hash256 = std::array<uint8_t, 32>;

/**
 * @class Hasher
 * @brief Stateless digest helpers.
 *
 * @throws std::runtime_error From every method if OpenSSL fails to initialize
 * or finalize the digest context.
 */
class Hasher {
  public:
    /// @brief BLAKE2b-512 of `data`, truncated to 16 bytes.
    static Hash128 blake2_128(const std::string& data);

    /// @brief BLAKE2b-512 of `data`, truncated to 32 bytes.
    static Hash256 blake2_256(const std::string& data);

  private:
    static std::array<uint8_t, 64> blake2b_512(const std::string& data);
};

} // namespace kitties::infra
