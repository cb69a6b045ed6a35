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
 * @file id_generator.cpp
 * @brief Implementation of the random identifier text source.
 *
 * @details
 * UUIDs strictly follow RFC 4122 for Version 4 (Random). Alphabet strings draw one
 * uniformly distributed index per character.
 */

#include "stableid/infra/id_generator.hpp"

#include "stableid/config.hpp"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace stableid::infra {

namespace {

/// Per-thread engine, seeded once from `std::random_device`.
std::mt19937_64& engine()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

} // namespace

std::string IdGenerator::nanoid(std::size_t length)
{
    return nanoid(length, STABLEID_NANOID_ALPHABET);
}

std::string IdGenerator::nanoid(std::size_t length, std::string_view alphabet)
{
    if (alphabet.empty()) {
        throw std::invalid_argument("IdGenerator::nanoid: alphabet must not be empty");
    }

    std::uniform_int_distribution<std::size_t> dis(0, alphabet.size() - 1);
    auto& gen = engine();

    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[dis(gen)]);
    }
    return out;
}

/**
 * @brief Generates an RFC 4122 compliant Version 4 UUID.
 *
 * - Sets Version bits to `0100` (Version 4) in the 7th byte.
 * - Sets Variant bits to `10` (Variant 1) in the 9th byte.
 */
std::string IdGenerator::uuid_v4()
{
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;
    auto& gen = engine();

    // 128 bits of randomness from two 64-bit samples.
    std::uint64_t p1 = dis(gen);
    std::uint64_t p2 = dis(gen);

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << static_cast<std::uint32_t>(p1 >> 32) << "-"
       << std::setw(4) << static_cast<std::uint16_t>((p1 >> 16) & 0xFFFF) << "-"
       << std::setw(4) << ((p1 & 0x0FFF) | 0x4000) << "-"
       << std::setw(4) << (((p2 >> 48) & 0x3FFF) | 0x8000) << "-"
       << std::setw(12) << (p2 & 0xFFFFFFFFFFFF);

    return ss.str();
}

} // namespace stableid::infra
