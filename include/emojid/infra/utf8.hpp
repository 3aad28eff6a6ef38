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
 * @file utf8.hpp
 * @brief UTF-8 code point primitives.
 *
 * @details
 * Identifier tokens are Unicode scalar values and every identifier string is
 * UTF-8. This header defines the `Utf8` utility class that converts between
 * the two representations so group lengths can be counted in code points
 * rather than bytes.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace emojid::infra {

/**
 * @class Utf8
 * @brief A static container for UTF-8 encode/decode algorithms.
 */
class Utf8 {
  public:
    /// Substitute emitted by `decode` for every byte that does not start a valid sequence.
    static constexpr char32_t kReplacement = U'\uFFFD';

    /// Largest Unicode code point.
    static constexpr char32_t kMaxCodePoint = U'\U0010FFFF';

    /**
     * @brief Reports whether `cp` is a Unicode scalar value.
     *
     * Scalar values are the code points `U+0000..U+10FFFF` excluding the
     * surrogate range `U+D800..U+DFFF`. Only scalar values can be encoded.
     */
    static bool is_scalar_value(char32_t cp);

    /**
     * @brief Appends the UTF-8 encoding of `cp` to `out`.
     *
     * Non-scalar values are written as `U+FFFD`.
     */
    static void append(std::string& out, char32_t cp);

    /// Returns the UTF-8 encoding of a single code point.
    static std::string encode(char32_t cp);

    /**
     * @brief Decodes a UTF-8 byte string into code points.
     *
     * **Malformed input handling:**
     * Overlong forms, encoded surrogates, values above `U+10FFFF`, truncated
     * sequences and stray continuation bytes are each replaced by a single
     * `U+FFFD` that consumes exactly one byte; decoding then resumes at the
     * next byte.
     *
     * @code
     * auto cps = emojid::infra::Utf8::decode("a\xF0\x9F\x90\xB6"); // {U'a', U'\U0001F436'}
     * @endcode
     */
    static std::vector<char32_t> decode(std::string_view s);
};

} // namespace emojid::infra
