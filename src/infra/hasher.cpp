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
 * @file hasher.cpp
 * @brief OpenSSL EVP implementation of the BLAKE2b helpers.
 */

#include "kitties/infra/hasher.hpp"

#include <algorithm>
#include <openssl/evp.h>
#include <stdexcept>

namespace kitties::infra {

std::array<uint8_t, 64> Hasher::blake2b_512(const std::string& data)
{
    std::array<uint8_t, 64> out{};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx)
        throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx, EVP_blake2b512(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: EVP blake2b512 digest failed");
    }

    EVP_MD_CTX_free(ctx);
    if (out_len != out.size())
        throw std::runtime_error("OpenSSL: unexpected BLAKE2b digest length");
    return out;
}

Hash128 Hasher::blake2_128(const std::string& data)
{
    auto full = blake2b_512(data);
    Hash128 out{};
    std::copy_n(full.begin(), out.size(), out.begin());
    return out;
}

Hash256 Hasher::blake2_256(const std::string& data)
{
    auto full = blake2b_512(data);
    Hash256 out{};
    std::copy_n(full.begin(), out.size(), out.begin());
    return out;
}

} // namespace kitties::infra
