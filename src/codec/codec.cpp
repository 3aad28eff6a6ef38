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
 * @file codec.cpp
 * @brief Grouped string formatting and strict parsing.
 */

#include "emojid/codec/codec.hpp"

#include "emojid/core/errors.hpp"
#include "emojid/infra/logger.hpp"
#include "emojid/infra/utf8.hpp"

#include <vector>

namespace emojid::codec {

namespace {

/// Splits on every delimiter; adjacent or trailing delimiters yield empty parts.
std::vector<std::string_view> split(std::string_view s)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (;;) {
        const std::size_t pos = s.find(kDelimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

std::string format(const Identifier& id)
{
    std::string out;
    out.reserve(Identifier::kTokenCount * 4 + (kGroupCount - 1));

    std::size_t pos = 0;
    for (std::size_t g = 0; g < kGroupCount; ++g) {
        if (g > 0) {
            out.push_back(kDelimiter);
        }
        for (std::size_t k = 0; k < kGroupSizes[g]; ++k) {
            infra::Utf8::append(out, id[pos++]);
        }
    }
    return out;
}

/**
 * @brief Parses a grouped identifier string.
 *
 * Implementation Strategy:
 * 1. **Precondition**: The alphabet must be usable before any input is read.
 * 2. **Shape Pass**: Splits on the delimiter and decodes each group, checking
 * its code point count against the expected layout. No membership check runs
 * until the whole shape is known to be valid.
 * 3. **Membership Pass**: Builds the alphabet hash set once and checks tokens
 * in order.
 */
Identifier parse(std::string_view s, const Alphabet& alphabet)
{
    if (alphabet.size() < 2) {
        throw AlphabetTooSmallError();
    }

    const std::vector<std::string_view> parts = split(s);
    if (parts.size() != kGroupCount) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Codec: expected 5 groups, found " + std::to_string(parts.size()));
        throw InvalidFormatError();
    }

    std::vector<char32_t> decoded;
    decoded.reserve(Identifier::kTokenCount);
    for (std::size_t g = 0; g < kGroupCount; ++g) {
        const std::vector<char32_t> group = infra::Utf8::decode(parts[g]);
        if (group.size() != kGroupSizes[g]) {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Codec: group " + std::to_string(g) + " has " +
                                   std::to_string(group.size()) + " symbols, expected " +
                                   std::to_string(kGroupSizes[g]));
            throw InvalidFormatError();
        }
        decoded.insert(decoded.end(), group.begin(), group.end());
    }

    if (decoded.size() != Identifier::kTokenCount) {
        throw InvalidFormatError();
    }

    const auto members = alphabet.member_set();

    Identifier::Tokens tokens{};
    for (std::size_t i = 0; i < Identifier::kTokenCount; ++i) {
        if (members.count(decoded[i]) == 0) {
            throw InvalidTokenError(decoded[i]);
        }
        tokens[i] = decoded[i];
    }

    return Identifier(tokens);
}

bool validate(std::string_view s)
{
    try {
        parse(s, default_alphabet());
        return true;
    } catch (const Error&) {
        return false;
    }
}

} // namespace emojid::codec
