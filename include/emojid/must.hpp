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
 * @file must.hpp
 * @brief Aborting convenience wrappers over the throwing API.
 *
 * @details
 * Each function forwards to its counterpart in `emojid.hpp`. Any
 * `emojid::Error` is logged at FATAL and the process is terminated with
 * `std::abort()`.
 *
 * @warning Intended for call sites where failure is a programming error
 * (e.g. parsing a compile-time constant). Never feed untrusted input to
 * `must_parse`.
 */

#pragma once

#include "emojid/core/identifier.hpp"

#include <string>
#include <string_view>

namespace emojid {

Identifier must_generate();

std::string must_generate_string();

Identifier must_parse(std::string_view s);

} // namespace emojid
