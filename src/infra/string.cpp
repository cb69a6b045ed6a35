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
 * @brief Implementation of the byte-level string primitives.
 */

#include "stableid/infra/string.hpp"

#include <cstdint>

namespace stableid::infra {

/**
 * @brief Validates UTF-8 with a single forward scan.
 *
 * Implementation Strategy:
 * 1. **Lead byte**: Classifies the sequence length and the allowed range of the
 *    first continuation byte (this is where overlongs and surrogates are rejected).
 * 2. **Continuation bytes**: Each must match `10xxxxxx`.
 *
 * @note Bytes are read as `unsigned char` to avoid sign extension on platforms
 * where `char` is signed.
 */
bool String::is_valid_utf8(std::string_view bytes)
{
    const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t size = bytes.size();
    std::size_t i = 0;

    while (i < size) {
        const unsigned char lead = p[i];

        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t extra = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
        } else if (lead == 0xE0) {
            extra = 2;
            lo = 0xA0;
        } else if (lead == 0xED) {
            extra = 2;
            hi = 0x9F;
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            extra = 2;
        } else if (lead == 0xF0) {
            extra = 3;
            lo = 0x90;
        } else if (lead == 0xF4) {
            extra = 3;
            hi = 0x8F;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            extra = 3;
        } else {
            // 0x80..0xC1 (stray continuation / overlong 2-byte) or 0xF5..0xFF.
            return false;
        }

        if (size - i <= extra) {
            return false;
        }

        if (p[i + 1] < lo || p[i + 1] > hi) {
            return false;
        }
        for (std::size_t k = 2; k <= extra; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) {
                return false;
            }
        }

        i += extra + 1;
    }

    return true;
}

std::string_view String::trim_trailing_nulls(std::string_view bytes)
{
    std::size_t end = bytes.size();
    while (end > 0 && bytes[end - 1] == '\0') {
        --end;
    }
    return bytes.substr(0, end);
}

} // namespace stableid::infra
