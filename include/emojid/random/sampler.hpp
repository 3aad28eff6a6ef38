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
 * @file sampler.hpp
 * @brief Unbiased uniform index selection over an arbitrary range.
 *
 * @details
 * Declares the `Sampler` class which turns raw secure random bytes into
 * uniformly distributed indices in `[0, n)` using rejection sampling. Reducing
 * a random word with a plain `v % n` favours the low residues whenever `n`
 * does not divide the word range; discarding the top partial block of the
 * range removes that bias entirely.
 */

#pragma once

#include "emojid/core/identifier.hpp"
#include "emojid/random/entropy.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace emojid::random {

/**
 * @class Sampler
 * @brief Rejection sampler bound to an entropy source.
 *
 * @details
 * **Draw Widths:**
 * - `n <= 65536`: 2 bytes per attempt, big-endian, range `0..65535`.
 * - `65536 < n <= 2^32`: 4 bytes per attempt, big-endian, range `0..2^32-1`.
 *
 * In both cases `limit = R - (R mod n)` where `R` is the size of the draw
 * range; a draw `v >= limit` is discarded and the attempt repeated. The loop
 * has no iteration cap: the rejection probability is below one half per
 * attempt for any `n`.
 *
 * A Sampler holds only a reference to its source and is as thread-safe as
 * that source.
 */
class Sampler {
  public:
    /// Size of the 16-bit draw range.
    static constexpr std::uint64_t kNarrowRange = std::uint64_t{1} << 16;

    /// Size of the widened 32-bit draw range.
    static constexpr std::uint64_t kWideRange = std::uint64_t{1} << 32;

    explicit Sampler(EntropySource& source) : source_(source) {}

    /**
     * @brief Draws one index uniformly from `[0, n)`.
     *
     * @throws AlphabetTooSmallError if `n < 2`.
     * @throws std::length_error if `n > 2^32`.
     * @throws EntropyFailureError if the source fails.
     */
    std::size_t draw_index(std::size_t n);

    /**
     * @brief Draws `count` independent indices uniformly from `[0, alphabet_size)`.
     *
     * Either all `count` indices are returned or the call throws; no partial
     * sequence is ever produced.
     *
     * @code
     * emojid::random::Sampler sampler(emojid::random::system_entropy());
     * auto idx = sampler.draw_indices(152); // 32 indices in [0, 152)
     * @endcode
     */
    std::vector<std::size_t> draw_indices(std::size_t alphabet_size,
                                          std::size_t count = Identifier::kTokenCount);

  private:
    std::uint32_t read_word(std::size_t width);

    EntropySource& source_;
};

} // namespace emojid::random
