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
 * @file id_generator.hpp
 * @brief Random-string source used by the stateless identifier generators.
 *
 * @details
 * This file declares the `IdGenerator` class, the default entropy source behind
 * `TinyIdGen`, `NanoIdGen` and `UuidGen`. It produces either random strings over a
 * fixed alphabet (nanoid style) or canonical Version 4 (random) UUIDs.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace stableid::infra {

/**
 * @class IdGenerator
 * @brief A static utility producing random identifier text.
 *
 * @details
 * Each thread owns its own random engine, so concurrent calls never contend on a lock.
 * The output carries no ordering; uniqueness is probabilistic.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a random string of `length` characters over the configured
     * alphabet (`STABLEID_NANOID_ALPHABET`).
     *
     * @param length Number of characters to produce. Zero yields an empty string.
     * @return std::string The generated text, exactly `length` bytes long.
     *
     * @code
     * std::string key = stableid::infra::IdGenerator::nanoid(21); // "V1StGXR8_Z5jdHi6B-myT"
     * @endcode
     */
    static std::string nanoid(std::size_t length);

    /**
     * @brief Generates a random string of `length` characters drawn from `alphabet`.
     *
     * @param length Number of characters to produce.
     * @param alphabet Candidate characters. Must not be empty.
     * @return std::string The generated text.
     *
     * @throws std::invalid_argument If `alphabet` is empty.
     */
    static std::string nanoid(std::size_t length, std::string_view alphabet);

    /**
     * @brief Generates a random Version 4 UUID string.
     *
     * The output adheres to the canonical textual representation
     * `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx`, where `y` is one of `{8, 9, a, b}`.
     *
     * @return std::string The generated UUID (36 characters).
     */
    static std::string uuid_v4();
};

} // namespace stableid::infra
