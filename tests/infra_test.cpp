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
 * @brief Unit tests for shared infrastructure primitives (Utf8, Logger).
 *
 * @details
 * Group lengths are counted on decoded code points, so the decoder's handling
 * of malformed input directly decides whether a string is rejected as badly
 * shaped or as containing a foreign token.
 */

#include "emojid/infra/logger.hpp"
#include "emojid/infra/utf8.hpp"
#include "framework.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using emojid::infra::LogLevel;
using emojid::infra::Logger;
using emojid::infra::Utf8;

/**
 * @brief Encodes one code point of each UTF-8 length class.
 */
void test_utf8_encode_lengths()
{
    ASSERT_EQ(Utf8::encode(U'A'), std::string("A"));
    ASSERT_EQ(Utf8::encode(U'é'), std::string("\xC3\xA9"));
    ASSERT_EQ(Utf8::encode(U'✈'), std::string("\xE2\x9C\x88"));
    ASSERT_EQ(Utf8::encode(U'\U0001F600'), std::string("\xF0\x9F\x98\x80"));

    // Non-scalar values are never emitted as-is.
    ASSERT_EQ(Utf8::encode(static_cast<char32_t>(0xD800)), std::string("\xEF\xBF\xBD"));
}

void test_utf8_decode_valid()
{
    std::vector<char32_t> cps = Utf8::decode("A\xC3\xA9\xE2\x9C\x88\xF0\x9F\x98\x80");
    ASSERT_EQ(cps.size(), static_cast<std::size_t>(4));
    ASSERT_EQ(static_cast<std::uint32_t>(cps[0]), static_cast<std::uint32_t>(0x41));
    ASSERT_EQ(static_cast<std::uint32_t>(cps[1]), static_cast<std::uint32_t>(0xE9));
    ASSERT_EQ(static_cast<std::uint32_t>(cps[2]), static_cast<std::uint32_t>(0x2708));
    ASSERT_EQ(static_cast<std::uint32_t>(cps[3]), static_cast<std::uint32_t>(0x1F600));

    ASSERT_TRUE(Utf8::decode("").empty());
}

/**
 * @brief Each byte of an invalid sequence becomes one replacement character.
 *
 * Scenarios verified:
 * - Stray continuation byte.
 * - Overlong two-byte form of '/'.
 * - Encoded surrogate U+D800.
 * - Value above U+10FFFF.
 * - Truncated sequence at end of input.
 */
void test_utf8_decode_malformed()
{
    const std::uint32_t r = static_cast<std::uint32_t>(Utf8::kReplacement);

    std::vector<char32_t> stray = Utf8::decode("\x80");
    ASSERT_EQ(stray.size(), static_cast<std::size_t>(1));
    ASSERT_EQ(static_cast<std::uint32_t>(stray[0]), r);

    ASSERT_EQ(Utf8::decode("\xC0\xAF").size(), static_cast<std::size_t>(2));
    ASSERT_EQ(Utf8::decode("\xED\xA0\x80").size(), static_cast<std::size_t>(3));
    ASSERT_EQ(Utf8::decode("\xF4\x90\x80\x80").size(), static_cast<std::size_t>(4));

    std::vector<char32_t> truncated = Utf8::decode("A\xF0\x9F\x98");
    ASSERT_EQ(truncated.size(), static_cast<std::size_t>(4));
    ASSERT_EQ(static_cast<std::uint32_t>(truncated[0]), static_cast<std::uint32_t>(0x41));
    for (std::size_t i = 1; i < truncated.size(); ++i) {
        ASSERT_EQ(static_cast<std::uint32_t>(truncated[i]), r);
    }
}

void test_utf8_scalar_values()
{
    ASSERT_TRUE(Utf8::is_scalar_value(U'\0'));
    ASSERT_TRUE(Utf8::is_scalar_value(U'\U0010FFFF'));
    ASSERT_FALSE(Utf8::is_scalar_value(static_cast<char32_t>(0xDFFF)));
    ASSERT_FALSE(Utf8::is_scalar_value(static_cast<char32_t>(0x110000)));
}

void test_logger_parse_level()
{
    ASSERT_TRUE(Logger::parse_level("trace") == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level("DEBUG") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("Warning") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("fatal") == LogLevel::FATAL);
    ASSERT_THROWS(Logger::parse_level("verbose"), std::invalid_argument);
}

/**
 * @brief The threshold gates which severities are written.
 */
void test_logger_threshold()
{
    const LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::WARN);
    ASSERT_FALSE(Logger::enabled(LogLevel::INFO));
    ASSERT_TRUE(Logger::enabled(LogLevel::WARN));
    ASSERT_TRUE(Logger::enabled(LogLevel::FATAL));

    // Suppressed messages are dropped silently.
    Logger::log(LogLevel::DEBUG, "Test: this entry must not be written.");

    Logger::set_level(saved);
    ASSERT_TRUE(Logger::level() == saved);
}
