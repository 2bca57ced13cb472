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
 * @file string.cpp
 * @brief Implementation of the text helpers.
 */

#include "kitties/infra/string.hpp"

#include <cctype>
#include <iterator>
#include <utility>

namespace kitties::infra {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

/**
 * @note The use of `static_cast<unsigned char>` prevents undefined behavior
 * with `std::isspace` for characters with negative values in signed `char`
 * environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_hex(const std::string& bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

bool String::from_hex(const std::string& hex, std::string& out)
{
    size_t pos = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        pos = 2;
    }
    if ((hex.size() - pos) % 2 != 0) {
        return false;
    }

    std::string decoded;
    decoded.reserve((hex.size() - pos) / 2);
    for (; pos < hex.size(); pos += 2) {
        int hi = hex_value(hex[pos]);
        int lo = hex_value(hex[pos + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        decoded.push_back(static_cast<char>((hi << 4) | lo));
    }

    out = std::move(decoded);
    return true;
}

} // namespace kitties::infra
