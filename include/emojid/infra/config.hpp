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
 * @file config.hpp
 * @brief JSON configuration for applications embedding the library.
 *
 * @details
 * Applications that let operators choose the identifier alphabet or the
 * diagnostic verbosity describe both in a small JSON document:
 *
 * @code
 * {
 *   "alphabet": ["🐶", "🐱", "🐭", "🐹"],
 *   "log_level": "warn"
 * }
 * @endcode
 *
 * `alphabet` may also be a single string, in which case every code point is
 * one entry. Both keys are optional.
 */

#pragma once

#include "emojid/core/alphabet.hpp"
#include "emojid/infra/logger.hpp"

#include <string>

namespace emojid::infra {

/**
 * @struct Config
 * @brief Parsed configuration values with their defaults applied.
 */
struct Config {
    /// Alphabet for generation and parsing. Defaults to the built-in alphabet.
    Alphabet alphabet = default_alphabet();

    /// Minimum severity written by the Logger.
    LogLevel log_level = LogLevel::INFO;
};

/**
 * @brief Parses a configuration document.
 *
 * @param json The JSON text.
 * @return Config The parsed values, defaults filled in for absent keys.
 *
 * @throws std::runtime_error on malformed JSON, a non-object root, wrongly
 * typed fields, an empty alphabet entry or an unknown log level.
 * @throws InvalidTokenError if an alphabet entry is longer than one code point
 * or is a reserved symbol.
 */
Config parse_config(const std::string& json);

/**
 * @brief Reads and parses a configuration file.
 *
 * @throws std::runtime_error if the file cannot be read, plus everything
 * `parse_config` throws.
 */
Config load_config(const std::string& path);

/// Applies process-wide settings (currently the log threshold).
void apply(const Config& config);

} // namespace emojid::infra
