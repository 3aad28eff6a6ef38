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
 * @file identifier.hpp
 * @brief The immutable 32-token identifier value.
 *
 * @details
 * An `Identifier` is laid out like a UUID, `8-4-4-4-12`, with one alphabet
 * symbol in place of each hex digit. It is a plain value: copyable, comparable,
 * and never modified after construction.
 */

#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace emojid {

/**
 * @class Identifier
 * @brief Fixed-length sequence of exactly 32 symbol tokens.
 *
 * @details
 * The default-constructed value has every token set to `U+0000`. This "zero"
 * identifier marks an uninitialised slot; it is never produced by parsing,
 * and generation only yields it if every draw hits a zero entry, which
 * alphabets cannot contain.
 */
class Identifier {
  public:
    static constexpr std::size_t kTokenCount = 32;

    using Tokens = std::array<char32_t, kTokenCount>;

    /// Constructs the zero identifier.
    Identifier() = default;

    explicit Identifier(const Tokens& tokens) : tokens_(tokens) {}

    /// Returns an independent copy of the 32 tokens.
    Tokens tokens() const
    {
        return tokens_;
    }

    /// Positional access, `index < kTokenCount`.
    char32_t operator[](std::size_t index) const
    {
        return tokens_[index];
    }

    /// True when every token is `U+0000`.
    bool is_zero() const;

    /// Formats as `XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX`.
    std::string to_string() const;

    friend bool operator==(const Identifier& a, const Identifier& b)
    {
        return a.tokens_ == b.tokens_;
    }

    friend bool operator!=(const Identifier& a, const Identifier& b)
    {
        return !(a == b);
    }

  private:
    Tokens tokens_{};
};

/// Streams the formatted identifier.
std::ostream& operator<<(std::ostream& os, const Identifier& id);

} // namespace emojid
