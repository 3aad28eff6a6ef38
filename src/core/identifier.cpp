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
 * @file identifier.cpp
 * @brief Identifier value operations.
 */

#include "emojid/core/identifier.hpp"

#include "emojid/codec/codec.hpp"

#include <algorithm>
#include <ostream>

namespace emojid {

bool Identifier::is_zero() const
{
    return std::all_of(tokens_.begin(), tokens_.end(), [](char32_t t) { return t == U'\0'; });
}

std::string Identifier::to_string() const
{
    return codec::format(*this);
}

std::ostream& operator<<(std::ostream& os, const Identifier& id)
{
    return os << id.to_string();
}

} // namespace emojid
