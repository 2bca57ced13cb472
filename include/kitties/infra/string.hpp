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
 * @file string.hpp
 * @brief Text helpers shared by the storage layer and the request front-end.
 *
 * @details
 * Identifiers and storage keys are raw byte strings. Whenever they cross a
 * textual boundary (log lines, JSON documents, wire responses) they are
 * rendered as lowercase hexadecimal through this class.
 */

#pragma once

#include <string>

namespace kitties::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, empty if `s` is all whitespace.
     *
     * @code
     * std::string line = kitties::infra::String::trim("  {\"call\":\"seal_block\"}\r\n");
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Renders a byte string as lowercase hexadecimal.
     *
     * @param bytes Arbitrary binary data.
     * @return std::string Two characters per input byte.
     */
    static std::string to_hex(const std::string& bytes);

    /**
     * @brief Decodes hexadecimal text back into raw bytes.
     *
     * Accepts upper- and lowercase digits. An optional `0x` prefix is skipped.
     *
     * @param hex The textual input.
     * @param out Receives the decoded bytes on success.
     * @return false If the input has odd length or a non-hex character.
     */
    static bool from_hex(const std::string& hex, std::string& out);
};

} // namespace kitties::infra
