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
 * @file errors.cpp
 * @brief Messages and codes of the library error taxonomy.
 */

#include "emojid/core/errors.hpp"

#include "emojid/infra/utf8.hpp"

#include <cstdio>

namespace emojid {

namespace {

/// Renders a token as `"<utf8>" (U+XXXX)` for error messages.
std::string describe_token(char32_t token)
{
    char code[16];
    std::snprintf(code, sizeof(code), "U+%04X", static_cast<unsigned>(token));
    return "\"" + infra::Utf8::encode(token) + "\" (" + code + ")";
}

} // namespace

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidFormat:
        return "invalid_format";
    case ErrorCode::InvalidToken:
        return "invalid_token";
    case ErrorCode::EntropyFailure:
        return "entropy_failure";
    case ErrorCode::AlphabetTooSmall:
        return "alphabet_too_small";
    }
    return "unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error("emojid: " + message), code_(code)
{
}

InvalidFormatError::InvalidFormatError() : Error(ErrorCode::InvalidFormat, "invalid format") {}

InvalidTokenError::InvalidTokenError(char32_t token)
    : Error(ErrorCode::InvalidToken,
            "invalid token (emoji not in alphabet): " + describe_token(token)),
      token_(token)
{
}

EntropyFailureError::EntropyFailureError()
    : Error(ErrorCode::EntropyFailure, "failed to read crypto randomness")
{
}

EntropyFailureError::EntropyFailureError(const std::string& detail)
    : Error(ErrorCode::EntropyFailure, "failed to read crypto randomness: " + detail)
{
}

AlphabetTooSmallError::AlphabetTooSmallError()
    : Error(ErrorCode::AlphabetTooSmall, "emoji alphabet must contain at least 2 entries")
{
}

} // namespace emojid
