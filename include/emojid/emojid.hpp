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
 * @file emojid.hpp
 * @brief Public entry points for generating and parsing emoji identifiers.
 *
 * @details
 * This header is the library's front door. It re-exports the value types and
 * error taxonomy and declares the high-level operations. All functions are
 * stateless and safe to call concurrently; failures are reported by throwing
 * a subclass of `emojid::Error`. Aborting shortcuts live in `must.hpp`.
 *
 * @code
 * std::string id = emojid::generate_string();
 * if (emojid::validate(id)) {
 *     emojid::Identifier parsed = emojid::parse(id);
 * }
 * @endcode
 */

#pragma once

#include "emojid/core/alphabet.hpp"
#include "emojid/core/errors.hpp"
#include "emojid/core/identifier.hpp"
#include "emojid/random/entropy.hpp"

#include <string>
#include <string_view>

namespace emojid {

// ------------------------------------------------------------------------
// Generation
// ------------------------------------------------------------------------

/**
 * @brief Generates a random identifier from the default alphabet.
 *
 * @throws EntropyFailureError if the kernel random source is unavailable.
 */
Identifier generate();

/**
 * @brief Generates a random identifier from `alphabet`.
 *
 * @throws AlphabetTooSmallError if `alphabet` has fewer than two entries.
 * @throws EntropyFailureError if the kernel random source is unavailable.
 */
Identifier generate_with_alphabet(const Alphabet& alphabet);

/**
 * @brief Generates a random identifier from `alphabet` using `source`.
 *
 * Same contract as the single-argument overload; the explicit source lets
 * callers supply their own CSPRNG or a deterministic test double.
 */
Identifier generate_with_alphabet(const Alphabet& alphabet, random::EntropySource& source);

/// Generates an identifier from the default alphabet and formats it.
std::string generate_string();

// ------------------------------------------------------------------------
// Parsing
// ------------------------------------------------------------------------

/// Parses against the default alphabet. See `codec::parse` for the error order.
Identifier parse(std::string_view s);

Identifier parse_with_alphabet(std::string_view s, const Alphabet& alphabet);

/// True iff `s` parses against the default alphabet.
bool validate(std::string_view s);

// ------------------------------------------------------------------------
// Value operations
// ------------------------------------------------------------------------

std::string format(const Identifier& id);

bool equal(const Identifier& a, const Identifier& b);

bool is_zero(const Identifier& id);

/// Independent copy of the 32 tokens; modifying it never affects `id`.
Identifier::Tokens tokens(const Identifier& id);

} // namespace emojid
