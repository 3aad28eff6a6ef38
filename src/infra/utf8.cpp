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
 * @file utf8.cpp
 * @brief Implementation of the UTF-8 code point primitives.
 *
 * @details
 * The decoder follows the well-formed byte sequence table of the Unicode
 * standard (Table 3-7): the permitted range of the second byte depends on the
 * lead byte, which rules out overlong forms and surrogates without a
 * post-decode check.
 */

#include "emojid/infra/utf8.hpp"

#include <cstdint>

namespace emojid::infra {

namespace {

bool in_range(std::uint8_t b, std::uint8_t lo, std::uint8_t hi)
{
    return b >= lo && b <= hi;
}

} // namespace

bool Utf8::is_scalar_value(char32_t cp)
{
    return cp <= kMaxCodePoint && !(cp >= 0xD800 && cp <= 0xDFFF);
}

void Utf8::append(std::string& out, char32_t cp)
{
    if (!is_scalar_value(cp)) {
        cp = kReplacement;
    }

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string Utf8::encode(char32_t cp)
{
    std::string out;
    append(out, cp);
    return out;
}

/**
 * @brief Decodes a UTF-8 byte string into code points.
 *
 * Implementation Strategy:
 * 1. **ASCII fast path**: Single-byte values are emitted directly.
 * 2. **Lead byte classification**: Determines the sequence length and the
 * valid range of the first continuation byte.
 * 3. **Continuation scan**: Every remaining byte must lie in `0x80..0xBF`.
 * 4. **Recovery**: On any violation a replacement character is emitted and
 * exactly one byte is consumed.
 */
std::vector<char32_t> Utf8::decode(std::string_view s)
{
    std::vector<char32_t> out;
    out.reserve(s.size());

    const auto byte_at = [&s](std::size_t i) { return static_cast<std::uint8_t>(s[i]); };

    std::size_t i = 0;
    while (i < s.size()) {
        const std::uint8_t b0 = byte_at(i);

        if (b0 < 0x80) {
            out.push_back(b0);
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        char32_t cp = 0;

        if (in_range(b0, 0xC2, 0xDF)) {
            len = 2;
            cp = b0 & 0x1F;
        } else if (in_range(b0, 0xE0, 0xEF)) {
            len = 3;
            cp = b0 & 0x0F;
            if (b0 == 0xE0)
                lo = 0xA0; // overlong
            else if (b0 == 0xED)
                hi = 0x9F; // surrogates
        } else if (in_range(b0, 0xF0, 0xF4)) {
            len = 4;
            cp = b0 & 0x07;
            if (b0 == 0xF0)
                lo = 0x90; // overlong
            else if (b0 == 0xF4)
                hi = 0x8F; // above U+10FFFF
        }

        bool valid = len != 0 && i + len <= s.size();
        if (valid) {
            for (std::size_t k = 1; k < len; ++k) {
                const std::uint8_t b = byte_at(i + k);
                const bool ok = (k == 1) ? in_range(b, lo, hi) : in_range(b, 0x80, 0xBF);
                if (!ok) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (b & 0x3F);
            }
        }

        if (valid) {
            out.push_back(cp);
            i += len;
        } else {
            out.push_back(kReplacement);
            ++i;
        }
    }

    return out;
}

} // namespace emojid::infra
