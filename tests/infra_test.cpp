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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (IdGenerator, String, Logger).
 *
 * @details
 * Random generation and UTF-8 validation sit underneath every generated identifier
 * and every `TinyId::as_str()` call, so their contracts are pinned down here.
 */

#include "stableid/config.hpp"
#include "stableid/infra/id_generator.hpp"
#include "stableid/infra/logger.hpp"
#include "stableid/infra/string.hpp"
#include "stableid/infra/type_name.hpp"
#include "framework.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace infra_fixture {
struct Widget {
};
} // namespace infra_fixture

/**
 * @brief Validates RFC 4122 layout of a Version 4 UUID.
 *
 * Canonical format 8-4-4-4-12 (36 characters), version nibble `4`, variant `10xx`.
 */
void test_uuid_format()
{
    std::string id = stableid::infra::IdGenerator::uuid_v4();
    ASSERT_EQ(id.length(), static_cast<std::size_t>(36));
    ASSERT_EQ(id[8], '-');
    ASSERT_EQ(id[13], '-');
    ASSERT_EQ(id[18], '-');
    ASSERT_EQ(id[23], '-');
    ASSERT_EQ(id[14], '4');
    ASSERT_TRUE(std::string_view("89ab").find(id[19]) != std::string_view::npos);
}

/**
 * @brief Sequential invocations advance the thread-local engine.
 */
void test_uuid_uniqueness()
{
    std::string id1 = stableid::infra::IdGenerator::uuid_v4();
    std::string id2 = stableid::infra::IdGenerator::uuid_v4();
    ASSERT_NE(id1, id2);
}

/**
 * @brief Nano identifiers have the requested length and only use the URL-safe alphabet.
 */
void test_nanoid_length_and_alphabet()
{
    const std::string_view alphabet = STABLEID_NANOID_ALPHABET;
    ASSERT_EQ(alphabet.size(), static_cast<std::size_t>(64));

    std::string id = stableid::infra::IdGenerator::nanoid(21);
    ASSERT_EQ(id.size(), static_cast<std::size_t>(21));
    for (char c : id) {
        ASSERT_TRUE(alphabet.find(c) != std::string_view::npos);
    }

    ASSERT_TRUE(stableid::infra::IdGenerator::nanoid(0).empty());
}

void test_nanoid_custom_alphabet()
{
    std::string id = stableid::infra::IdGenerator::nanoid(32, "ab");
    ASSERT_EQ(id.size(), static_cast<std::size_t>(32));
    for (char c : id) {
        ASSERT_TRUE(c == 'a' || c == 'b');
    }

    ASSERT_EQ(stableid::infra::IdGenerator::nanoid(3, "z"), std::string("zzz"));
    ASSERT_THROWS(stableid::infra::IdGenerator::nanoid(4, ""), std::invalid_argument);
}

/**
 * @brief UTF-8 validation accepts well-formed text of every sequence length.
 */
void test_utf8_valid()
{
    using stableid::infra::String;
    ASSERT_TRUE(String::is_valid_utf8(""));
    ASSERT_TRUE(String::is_valid_utf8("plain ascii"));
    ASSERT_TRUE(String::is_valid_utf8("caf\xC3\xA9"));          // U+00E9
    ASSERT_TRUE(String::is_valid_utf8("\xE2\x82\xAC"));         // U+20AC
    ASSERT_TRUE(String::is_valid_utf8("\xF0\x9F\x90\xB6"));     // U+1F436
    ASSERT_TRUE(String::is_valid_utf8(std::string_view("a\0\0", 3)));
}

/**
 * @brief UTF-8 validation rejects malformed sequences.
 *
 * Scenarios verified:
 * - Stray continuation byte.
 * - Overlong encodings (2- and 3-byte).
 * - UTF-16 surrogates.
 * - Code points above U+10FFFF.
 * - Truncated multi-byte sequences.
 */
void test_utf8_invalid()
{
    using stableid::infra::String;
    ASSERT_FALSE(String::is_valid_utf8("\x80"));
    ASSERT_FALSE(String::is_valid_utf8("\xC0\xAF"));
    ASSERT_FALSE(String::is_valid_utf8("\xE0\x80\xAF"));
    ASSERT_FALSE(String::is_valid_utf8("\xED\xA0\x80"));
    ASSERT_FALSE(String::is_valid_utf8("\xF4\x90\x80\x80"));
    ASSERT_FALSE(String::is_valid_utf8("\xE2\x82"));
    ASSERT_FALSE(String::is_valid_utf8("ok\xC3"));
}

void test_trim_trailing_nulls()
{
    using stableid::infra::String;
    ASSERT_EQ(String::trim_trailing_nulls(std::string_view("abc\0\0", 5)), std::string_view("abc"));
    ASSERT_EQ(String::trim_trailing_nulls(std::string_view("a\0b\0", 4)),
              std::string_view("a\0b", 3));
    ASSERT_TRUE(String::trim_trailing_nulls(std::string_view("\0\0\0", 3)).empty());
    ASSERT_TRUE(String::trim_trailing_nulls("").empty());
}

/**
 * @brief Level names parse case-insensitively and unknown names are refused.
 */
void test_logger_parse_level()
{
    using stableid::infra::Logger;
    using stableid::infra::LogLevel;

    LogLevel level = LogLevel::INFO;
    ASSERT_TRUE(Logger::parse_level("debug", level));
    ASSERT_TRUE(level == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("WARN", level));
    ASSERT_TRUE(level == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("Fatal", level));
    ASSERT_TRUE(level == LogLevel::FATAL);

    ASSERT_FALSE(Logger::parse_level("loud", level));
    ASSERT_TRUE(level == LogLevel::FATAL);
}

void test_logger_threshold()
{
    using stableid::infra::Logger;
    using stableid::infra::LogLevel;

    const LogLevel previous = Logger::min_level();

    Logger::set_min_level(LogLevel::ERROR);
    ASSERT_FALSE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::ERROR));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));

    Logger::set_min_level(LogLevel::TRACE);
    ASSERT_TRUE(Logger::enabled(LogLevel::TRACE));

    Logger::set_min_level(previous);
}

void test_type_name()
{
    ASSERT_EQ(stableid::infra::type_name<infra_fixture::Widget>(),
              std::string("infra_fixture::Widget"));
    ASSERT_EQ(stableid::infra::type_name<int>(), std::string("int"));
}
