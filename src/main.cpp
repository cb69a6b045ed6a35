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
 * @file main.cpp
 * @brief `stableid-gen`: prints freshly generated identifiers.
 *
 * @details
 * Startup sequence:
 * 1. Flag parsing (`--help`, `--json`, `--log-level`).
 * 2. Positional configuration (`COUNT`, `KIND`).
 * 3. Generation, one identifier per line, as plain text or as JSON.
 */

#include "stableid/config.hpp"
#include "stableid/infra/logger.hpp"
#include "stableid/serde/json.hpp"
#include "stableid/stableid.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

STABLEID_TINY_ID_DOMAIN(TinyKind, "tiny");

struct NanoKind : stableid::IdDomain<NanoKind> {
    static constexpr std::string_view name = "nano";
    using Backing = std::string;
    using Generator = stableid::NanoIdGen<>;
    using ConstRepr = void;
};

struct UuidKind : stableid::IdDomain<UuidKind> {
    static constexpr std::string_view name = "uuid";
    using Backing = std::string;
    using Generator = stableid::UuidGen<>;
    using ConstRepr = void;
};

struct SeqKind : stableid::IdDomain<SeqKind> {
    static constexpr std::string_view name = "seq";
    using Backing = std::uint64_t;
    using Generator = stableid::SequenceGen<std::uint64_t>;
    using ConstRepr = void;
};

template <typename D>
void emit(const stableid::Id<D>& id, bool as_json)
{
    if (as_json) {
        std::cout << stableid::serde::to_json_string(id) << "\n";
    } else {
        std::cout << id.backing() << "\n";
    }
}

template <typename D>
void emit_stateless(std::size_t count, bool as_json)
{
    for (std::size_t i = 0; i < count; ++i) {
        emit(D::generate_id(), as_json);
    }
}

} // namespace

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS] [COUNT] [KIND]\n"
              << "Arguments:\n"
              << "  COUNT               Number of identifiers to print (Default: 1)\n"
              << "  KIND                tiny | nano | uuid | seq (Default: tiny)\n"
              << "Options:\n"
              << "  --json              Print each identifier as a JSON value\n"
              << "  --log-level LEVEL   TRACE, DEBUG, INFO, WARN, ERROR or FATAL\n"
              << "  --help              Show this help message\n";
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    using stableid::infra::Logger;
    using stableid::infra::LogLevel;

    // 1. Configuration Defaults
    std::size_t count = 1;
    std::string kind = "tiny";
    bool as_json = false;

    try {
        // 2. Parse Command Line Arguments
        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help") {
                print_help(argv[0]);
                return 0;
            }
            if (arg == "--json") {
                as_json = true;
            } else if (arg == "--log-level") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("--log-level expects a value");
                }
                LogLevel level;
                if (!Logger::parse_level(argv[++i], level)) {
                    throw std::invalid_argument("unknown log level '" +
                                                std::string(argv[i]) + "'");
                }
                Logger::set_min_level(level);
            } else if (arg.rfind("--", 0) == 0) {
                throw std::invalid_argument("unknown option '" + arg + "'");
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.size() > 2) {
            throw std::invalid_argument("too many arguments");
        }
        if (!positional.empty()) {
            const long long requested = std::stoll(positional[0]);
            if (requested < 0) {
                throw std::invalid_argument("COUNT must not be negative");
            }
            count = static_cast<std::size_t>(requested);
        }
        if (positional.size() > 1) {
            kind = positional[1];
        }

        Logger::log(LogLevel::DEBUG, "System: stableid-gen v" STABLEID_VERSION);
        Logger::log(LogLevel::DEBUG,
                    "Config: " + std::to_string(count) + " identifier(s) of kind '" + kind +
                        "'" + (as_json ? " as JSON" : ""));

        // 3. Generation
        if (kind == "tiny") {
            emit_stateless<TinyKind>(count, as_json);
        } else if (kind == "nano") {
            emit_stateless<NanoKind>(count, as_json);
        } else if (kind == "uuid") {
            emit_stateless<UuidKind>(count, as_json);
        } else if (kind == "seq") {
            SeqKind::Generator sequence;
            for (std::size_t i = 0; i < count; ++i) {
                emit(SeqKind::generate_id_stateful(sequence), as_json);
            }
        } else {
            throw std::invalid_argument("unknown KIND '" + kind + "'");
        }

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    std::cout.flush();
    return 0;
}
