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
 * @file config.hpp
 * @brief Compile-time configuration defaults for the stableid library.
 *
 * @details
 * Every value below can be overridden from the build system with a `-D` definition
 * (e.g. `-DSTABLEID_TINY_ID_DEFAULT_LENGTH=16`). Runtime configuration (log threshold,
 * CLI options) lives with the components that consume it.
 */

#pragma once

/// @brief Library version string reported by the `stableid-gen` tool.
#ifndef STABLEID_VERSION
#define STABLEID_VERSION "0.3.0"
#endif

/// @brief Default capacity (in bytes) of `stableid::TinyId<>`.
#ifndef STABLEID_TINY_ID_DEFAULT_LENGTH
#define STABLEID_TINY_ID_DEFAULT_LENGTH 21
#endif

/// @brief Default length of identifiers produced by `stableid::NanoIdGen<>`.
#ifndef STABLEID_NANOID_DEFAULT_LENGTH
#define STABLEID_NANOID_DEFAULT_LENGTH 21
#endif

/**
 * @brief Alphabet used by the random-string source.
 *
 * The default is the 64 character URL-safe set. The size must stay a power of two
 * for the generator to draw characters without modulo bias.
 */
#ifndef STABLEID_NANOID_ALPHABET
#define STABLEID_NANOID_ALPHABET "_-0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
#endif

/**
 * @brief Initial minimum severity of `stableid::infra::Logger`.
 *
 * Expressed as an enumerator of `stableid::infra::LogLevel`.
 */
#ifndef STABLEID_DEFAULT_LOG_LEVEL
#define STABLEID_DEFAULT_LOG_LEVEL INFO
#endif
