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
 * @file codec.hpp
 * @brief Fixed-width little-endian integer encoding.
 *
 * @details
 * Every integer that is hashed or persisted goes through this class so the
 * byte layout does not depend on the host's endianness. This matters for the
 * DNA derivation, which must be reproducible on any node replaying a block.
 */

#pragma once

#include <cstdint>
#include <string>

namespace kitties::infra {

/**
 * @class Codec
 * @brief Static helpers appending and reading little-endian integers.
 */
class Codec {
  public:
    /// @brief Appends `value` as 4 little-endian bytes.
    static void put_u32_le(std::string& out, uint32_t value);

    /// @brief Appends `value` as 8 little-endian bytes.
    static void put_u64_le(std::string& out, uint64_t value);

    /**
     * @brief Reads 8 little-endian bytes.
     *
     * @param in Source buffer.
     * @param out Receives the decoded value.
     * @return false If `in` is not exactly 8 bytes long.
     */
    static bool get_u64_le(const std::string& in, uint64_t& out);
};

} // namespace kitties::infra
