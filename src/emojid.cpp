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
 * @file emojid.cpp
 * @brief Implementation of the public generation and parsing API.
 *
 * @details
 * Generation maps 32 rejection-sampled indices onto the alphabet. The token
 * array is only turned into an `Identifier` after every draw succeeded, so an
 * entropy failure midway never leaks a partially random value.
 */

#include "emojid/emojid.hpp"

#include "emojid/codec/codec.hpp"
#include "emojid/random/sampler.hpp"

namespace emojid {

Identifier generate()
{
    return generate_with_alphabet(default_alphabet());
}

Identifier generate_with_alphabet(const Alphabet& alphabet)
{
    return generate_with_alphabet(alphabet, random::system_entropy());
}

Identifier generate_with_alphabet(const Alphabet& alphabet, random::EntropySource& source)
{
    if (alphabet.size() < 2) {
        throw AlphabetTooSmallError();
    }

    random::Sampler sampler(source);
    const std::vector<std::size_t> indices = sampler.draw_indices(alphabet.size());

    Identifier::Tokens tokens{};
    for (std::size_t i = 0; i < Identifier::kTokenCount; ++i) {
        tokens[i] = alphabet[indices[i]];
    }
    return Identifier(tokens);
}

std::string generate_string()
{
    return codec::format(generate());
}

Identifier parse(std::string_view s)
{
    return codec::parse(s, default_alphabet());
}

Identifier parse_with_alphabet(std::string_view s, const Alphabet& alphabet)
{
    return codec::parse(s, alphabet);
}

bool validate(std::string_view s)
{
    return codec::validate(s);
}

std::string format(const Identifier& id)
{
    return codec::format(id);
}

bool equal(const Identifier& a, const Identifier& b)
{
    return a == b;
}

bool is_zero(const Identifier& id)
{
    return id.is_zero();
}

Identifier::Tokens tokens(const Identifier& id)
{
    return id.tokens();
}

} // namespace emojid
