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
 * @file codec.hpp
 * @brief Text form of identifiers: formatting, parsing and validation.
 *
 * @details
 * The canonical text form is five groups of `8, 4, 4, 4, 12` symbols joined by
 * a single `-`, UTF-8 encoded, with no surrounding whitespace:
 *
 * `😀😃😄😁😆😅😂🤣-😊😇🙂🙃-😉😌😍🥰-😘😗😙😚-😋😛😝😜🤪🤨🧐🤓😎🥳😤😡`
 *
 * Group lengths count code points, not bytes.
 */

#pragma once

#include "emojid/core/alphabet.hpp"
#include "emojid/core/identifier.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace emojid::codec {

/// Group separator. Alphabets may not contain it.
inline constexpr char kDelimiter = '-';

/// Number of delimiter-separated groups.
inline constexpr std::size_t kGroupCount = 5;

/// Symbols per group, in order.
inline constexpr std::array<std::size_t, kGroupCount> kGroupSizes = {8, 4, 4, 4, 12};

/**
 * @brief Formats an identifier in the grouped layout.
 *
 * Deterministic and total; the zero identifier formats as NUL characters.
 */
std::string format(const Identifier& id);

/**
 * @brief Parses a grouped string and checks every symbol against `alphabet`.
 *
 * **Validation Order:**
 * 1. Alphabet size (`AlphabetTooSmallError`), before touching the input.
 * 2. Group count, then each group length in order (`InvalidFormatError`).
 * 3. Membership of each symbol in sequence order; the first foreign symbol
 * raises `InvalidTokenError` carrying it.
 */
Identifier parse(std::string_view s, const Alphabet& alphabet);

/// True iff `parse(s, default_alphabet())` succeeds.
bool validate(std::string_view s);

} // namespace emojid::codec
