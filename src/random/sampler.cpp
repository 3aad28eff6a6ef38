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
 * @file sampler.cpp
 * @brief Rejection sampling implementation.
 */

#include "emojid/random/sampler.hpp"

#include "emojid/core/errors.hpp"
#include "emojid/infra/logger.hpp"

#include <stdexcept>
#include <string>

namespace emojid::random {

/// Reads a big-endian word of `width` bytes (2 or 4).
std::uint32_t Sampler::read_word(std::size_t width)
{
    std::uint8_t buf[4];
    source_.fill(buf, width);

    std::uint32_t v = 0;
    for (std::size_t i = 0; i < width; ++i) {
        v = (v << 8) | buf[i];
    }
    return v;
}

/**
 * @brief Draws one index uniformly from `[0, n)`.
 *
 * Implementation Strategy:
 * 1. **Width Selection**: 16-bit draws cover every `n` up to 65536; larger
 * ranges switch to 32-bit draws.
 * 2. **Limit**: The largest multiple of `n` not exceeding the draw range.
 * 3. **Rejection**: Draws at or above the limit are discarded.
 * 4. **Reduction**: Accepted draws are reduced modulo `n`; each residue then
 * has exactly `limit / n` preimages.
 */
std::size_t Sampler::draw_index(std::size_t n)
{
    if (n < 2) {
        throw AlphabetTooSmallError();
    }

    const std::uint64_t range = static_cast<std::uint64_t>(n);
    if (range > kWideRange) {
        throw std::length_error("Sampler: range of " + std::to_string(n) +
                                " exceeds the 32-bit draw width");
    }

    const bool narrow = range <= kNarrowRange;
    const std::uint64_t span = narrow ? kNarrowRange : kWideRange;
    const std::size_t width = narrow ? 2 : 4;
    const std::uint64_t limit = span - (span % range);

    for (;;) {
        const std::uint64_t v = read_word(width);
        if (v < limit) {
            return static_cast<std::size_t>(v % range);
        }
        if (infra::Logger::enabled(infra::LogLevel::TRACE)) {
            infra::Logger::log(infra::LogLevel::TRACE, "Sampler: rejected draw " +
                                                           std::to_string(v) + " (limit " +
                                                           std::to_string(limit) + ")");
        }
    }
}

std::vector<std::size_t> Sampler::draw_indices(std::size_t alphabet_size, std::size_t count)
{
    if (alphabet_size < 2) {
        throw AlphabetTooSmallError();
    }

    std::vector<std::size_t> indices;
    indices.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        indices.push_back(draw_index(alphabet_size));
    }
    return indices;
}

} // namespace emojid::random
