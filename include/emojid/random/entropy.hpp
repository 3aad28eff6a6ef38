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
 * @file entropy.hpp
 * @brief Cryptographically secure random byte sources.
 *
 * @details
 * The sampler never talks to the operating system directly; it reads bytes
 * through the `EntropySource` interface. Production code uses the kernel
 * CSPRNG via `system_entropy()`. Tests substitute scripted sources to drive
 * the rejection loop deterministically.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace emojid::random {

/**
 * @class EntropySource
 * @brief Abstract supplier of secure random bytes.
 */
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    /**
     * @brief Fills `out[0..len)` with random bytes.
     *
     * Either the whole buffer is filled or the call throws; implementations
     * never return a partially written buffer as success.
     *
     * @throws EntropyFailureError if the source cannot supply bytes.
     */
    virtual void fill(std::uint8_t* out, std::size_t len) = 0;
};

/**
 * @class SystemEntropySource
 * @brief Kernel CSPRNG backed source (`getrandom(2)`).
 *
 * @details
 * Stateless, so a single instance may be shared by any number of threads.
 * Short reads and `EINTR` are retried; any other failure is reported as
 * `EntropyFailureError` and logged.
 */
class SystemEntropySource : public EntropySource {
  public:
    void fill(std::uint8_t* out, std::size_t len) override;
};

/// Process-wide kernel-backed source.
EntropySource& system_entropy();

} // namespace emojid::random
