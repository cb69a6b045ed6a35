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
 * @brief Byte-level string primitives used by fixed-capacity identifiers.
 *
 * @details
 * This header defines the `String` utility class: UTF-8 validation and null-padding
 * handling for byte buffers that are reinterpreted as text.
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace stableid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Checks that a byte range is well-formed UTF-8.
     *
     * Rejects overlong encodings, UTF-16 surrogate code points (U+D800..U+DFFF),
     * code points above U+10FFFF and truncated sequences. Null bytes are valid.
     *
     * @param bytes The byte range to inspect.
     * @return true If every byte belongs to a complete, well-formed sequence.
     *
     * @code
     * String::is_valid_utf8("h\xC3\xA9llo"); // true
     * String::is_valid_utf8("\xC3");         // false (truncated)
     * @endcode
     */
    static bool is_valid_utf8(std::string_view bytes);

    /**
     * @brief Strips every trailing `'\0'` byte.
     *
     * Embedded nulls that are followed by other bytes are kept.
     *
     * @param bytes The source view.
     * @return std::string_view A view over the same storage, shortened.
     */
    static std::string_view trim_trailing_nulls(std::string_view bytes);
};

} // namespace stableid::infra
