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
 * @file alphabet.hpp
 * @brief Ordered symbol sets used to generate and validate identifiers.
 *
 * @details
 * An `Alphabet` is an immutable, ordered list of single code points. The same
 * alphabet drives generation (index to symbol) and parsing (membership test).
 * The library ships one built-in alphabet of 152 single-code-point emoji; it
 * is a constant and cannot be replaced at runtime. Callers wanting a different
 * symbol set construct their own `Alphabet` and pass it explicitly.
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace emojid {

/**
 * @class Alphabet
 * @brief Immutable ordered sequence of identifier symbols.
 *
 * @details
 * **Entry Rules (enforced at construction):**
 * - Each entry is a Unicode scalar value.
 * - `U+0000` is reserved for the zero identifier.
 * - The group delimiter `-` cannot appear, or formatted strings would not split back.
 * - `U+FFFD` is reserved for malformed UTF-8 produced by the decoder.
 *
 * A violating entry raises `InvalidTokenError`. Duplicate entries are accepted
 * but logged, since they bias generation towards the repeated symbol.
 *
 * The minimum size of two entries is NOT checked here; generation and parsing
 * check it and raise `AlphabetTooSmallError`.
 */
class Alphabet {
  public:
    /// Constructs an empty alphabet. Unusable for generation or parsing.
    Alphabet() = default;

    explicit Alphabet(std::vector<char32_t> symbols);

    Alphabet(std::initializer_list<char32_t> symbols);

    /**
     * @brief Builds an alphabet with one entry per code point of a UTF-8 string.
     *
     * @code
     * auto hex = emojid::Alphabet::from_utf8("0123456789abcdef");
     * @endcode
     *
     * @throws InvalidTokenError if the text is malformed UTF-8 or contains a reserved entry.
     */
    static Alphabet from_utf8(std::string_view text);

    std::size_t size() const noexcept
    {
        return symbols_.size();
    }

    bool empty() const noexcept
    {
        return symbols_.empty();
    }

    /// Unchecked positional access.
    char32_t operator[](std::size_t index) const
    {
        return symbols_[index];
    }

    const std::vector<char32_t>& symbols() const noexcept
    {
        return symbols_;
    }

    /// Builds a hash set of the entries for O(1) membership tests.
    std::unordered_set<char32_t> member_set() const;

    /// Renders the entries, in order, as a UTF-8 string.
    std::string to_utf8() const;

  private:
    void check_entries() const;

    std::vector<char32_t> symbols_;
};

/**
 * @brief The built-in 152-entry emoji alphabet.
 *
 * Avoids ZWJ sequences, flags, skin tones, variation selectors and any other
 * multi-code-point cluster. The returned reference is valid for the lifetime
 * of the process.
 */
const Alphabet& default_alphabet();

} // namespace emojid
