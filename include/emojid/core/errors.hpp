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
 * @file errors.hpp
 * @brief Error taxonomy of the identifier library.
 *
 * @details
 * Every fallible operation reports failure by throwing a subclass of
 * `emojid::Error`. The four kinds are mutually exclusive; callers that only
 * care about the category can catch `Error` and switch on `code()`.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace emojid {

/**
 * @enum ErrorCode
 * @brief Category of an `emojid::Error`.
 */
enum class ErrorCode {
    InvalidFormat,   ///< Wrong group count, group length or total length.
    InvalidToken,    ///< Structurally valid, but a token is outside the alphabet.
    EntropyFailure,  ///< The secure random source could not be read.
    AlphabetTooSmall ///< The alphabet has fewer than two entries.
};

/// Returns the stable lowercase name of an error code (e.g. `"invalid_format"`).
const char* to_string(ErrorCode code);

/**
 * @class Error
 * @brief Base class of all library errors.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept
    {
        return code_;
    }

  private:
    ErrorCode code_;
};

class InvalidFormatError : public Error {
  public:
    InvalidFormatError();
};

/**
 * @class InvalidTokenError
 * @brief Raised for a token that is not a member of the alphabet.
 *
 * The offending code point is kept for diagnostics and quoted in `what()`.
 */
class InvalidTokenError : public Error {
  public:
    explicit InvalidTokenError(char32_t token);

    char32_t token() const noexcept
    {
        return token_;
    }

  private:
    char32_t token_;
};

class EntropyFailureError : public Error {
  public:
    EntropyFailureError();

    /// @param detail Cause reported by the operating system.
    explicit EntropyFailureError(const std::string& detail);
};

class AlphabetTooSmallError : public Error {
  public:
    AlphabetTooSmallError();
};

} // namespace emojid
