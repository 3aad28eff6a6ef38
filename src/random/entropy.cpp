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
 * @file entropy.cpp
 * @brief Kernel CSPRNG access.
 */

#include "emojid/random/entropy.hpp"

#include "emojid/core/errors.hpp"
#include "emojid/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/random.h>

namespace emojid::random {

/**
 * @brief Reads `len` bytes from the kernel random pool.
 *
 * `getrandom` without flags blocks only until the pool is initialised at boot
 * and may return fewer bytes than requested for large buffers or when a signal
 * arrives, so the read is repeated until the buffer is full.
 */
void SystemEntropySource::fill(std::uint8_t* out, std::size_t len)
{
    std::size_t filled = 0;
    while (filled < len) {
        ssize_t n = ::getrandom(out + filled, len - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            infra::Logger::log(infra::LogLevel::ERROR, "Entropy: getrandom failed: " + reason);
            throw EntropyFailureError(reason);
        }
        filled += static_cast<std::size_t>(n);
    }
}

EntropySource& system_entropy()
{
    static SystemEntropySource source;
    return source;
}

} // namespace emojid::random
