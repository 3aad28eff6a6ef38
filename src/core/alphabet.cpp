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
 * @file alphabet.cpp
 * @brief Alphabet construction, entry validation and the built-in symbol table.
 */

#include "emojid/core/alphabet.hpp"

#include "emojid/codec/codec.hpp"
#include "emojid/core/errors.hpp"
#include "emojid/infra/logger.hpp"
#include "emojid/infra/utf8.hpp"

#include <array>
#include <utility>

namespace emojid {

namespace {

// Curated single-code-point emoji. The order is part of the public contract:
// index i of a draw always maps to entry i.
constexpr std::array<char32_t, 152> kDefaultSymbols = {
    U'😀', U'😃', U'😄', U'😁', U'😆', U'😅', U'😂', U'🤣',
    U'😊', U'😇', U'🙂', U'🙃', U'😉', U'😌', U'😍', U'🥰',
    U'😘', U'😗', U'😙', U'😚', U'😋', U'😛', U'😝', U'😜',
    U'🤪', U'🤨', U'🧐', U'🤓', U'😎', U'🥳', U'😤', U'😡',
    U'🤯', U'😱', U'😴', U'🤤', U'😷', U'🤒', U'🤕', U'🤠',
    U'😈', U'👻', U'🤖', U'🎃', U'🐶', U'🐱', U'🐭', U'🐹',
    U'🐰', U'🦊', U'🐻', U'🐼', U'🐨', U'🐯', U'🦁', U'🐸',
    U'🐵', U'🐔', U'🐧', U'🐦', U'🐤', U'🐙', U'🦑', U'🦀',
    U'🐠', U'🐳', U'🦋', U'🐞', U'🌸', U'🌼', U'🌻', U'🌺',
    U'🍎', U'🍊', U'🍋', U'🍉', U'🍇', U'🍓', U'🍒', U'🍍',
    U'🥑', U'🥦', U'🥕', U'🌶', U'🍔', U'🍟', U'🍕', U'🌮',
    U'🍣', U'🍩', U'🍪', U'🍫', U'🍿', U'☕', U'🍺', U'🍷',
    U'⚽', U'🏀', U'🏈', U'⚾', U'🎾', U'🏐', U'🎱', U'🏓',
    U'🎸', U'🎹', U'🥁', U'🎻', U'🎧', U'🎮', U'🧩', U'🎲',
    U'🚗', U'🚕', U'🚌', U'🚑', U'🚒', U'🚜', U'✈', U'🚀',
    U'🛰', U'⛵', U'🚲', U'🛴', U'🏠', U'🏢', U'🏭', U'🏰',
    U'🌍', U'🌙', U'⭐', U'⚡', U'🔥', U'💧', U'🌈', U'❄',
    U'💎', U'🔒', U'🔑', U'🧠', U'💡', U'📦', U'🧲', U'🧰',
    U'🛡', U'⚙', U'🧪', U'🧬', U'🔭', U'📡', U'💾', U'🗄',
};

} // namespace

Alphabet::Alphabet(std::vector<char32_t> symbols) : symbols_(std::move(symbols))
{
    check_entries();
}

Alphabet::Alphabet(std::initializer_list<char32_t> symbols) : symbols_(symbols)
{
    check_entries();
}

Alphabet Alphabet::from_utf8(std::string_view text)
{
    return Alphabet(infra::Utf8::decode(text));
}

/**
 * @brief Rejects entries that would break formatting or parsing.
 *
 * Duplicate detection shares the pass with the reserved-entry check; the
 * first reserved entry found aborts construction.
 */
void Alphabet::check_entries() const
{
    std::unordered_set<char32_t> seen;
    seen.reserve(symbols_.size());
    std::size_t duplicates = 0;

    for (char32_t symbol : symbols_) {
        if (!infra::Utf8::is_scalar_value(symbol) || symbol == U'\0' ||
            symbol == static_cast<char32_t>(codec::kDelimiter) ||
            symbol == infra::Utf8::kReplacement) {
            throw InvalidTokenError(symbol);
        }
        if (!seen.insert(symbol).second) {
            ++duplicates;
        }
    }

    if (duplicates > 0) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Alphabet: " + std::to_string(duplicates) +
                               " duplicate entries; generation will favour repeated symbols.");
    }
}

std::unordered_set<char32_t> Alphabet::member_set() const
{
    return std::unordered_set<char32_t>(symbols_.begin(), symbols_.end());
}

std::string Alphabet::to_utf8() const
{
    std::string out;
    out.reserve(symbols_.size() * 4);
    for (char32_t symbol : symbols_) {
        infra::Utf8::append(out, symbol);
    }
    return out;
}

const Alphabet& default_alphabet()
{
    static const Alphabet alphabet(
        std::vector<char32_t>(kDefaultSymbols.begin(), kDefaultSymbols.end()));
    return alphabet;
}

} // namespace emojid
