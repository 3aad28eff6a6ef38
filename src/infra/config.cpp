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
 * @file config.cpp
 * @brief cJSON-backed configuration loader.
 */

#include "emojid/infra/config.hpp"

#include "emojid/core/errors.hpp"
#include "emojid/infra/utf8.hpp"

#include <cJSON.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace emojid::infra {

namespace {

/**
 * @class ScopedJson
 * @brief Owns a parsed cJSON tree and releases it on scope exit.
 *
 * Field validation below throws halfway through the tree walk; the guard keeps
 * those paths leak-free.
 */
class ScopedJson {
  public:
    explicit ScopedJson(cJSON* root) : root_(root) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ~ScopedJson()
    {
        if (root_) {
            cJSON_Delete(root_);
        }
    }

    cJSON* get() const
    {
        return root_;
    }

  private:
    cJSON* root_;
};

/// Converts one array element to a single alphabet entry.
char32_t single_symbol(const cJSON* item, int index)
{
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw std::runtime_error("Config: alphabet[" + std::to_string(index) +
                                 "] must be a string");
    }

    const std::vector<char32_t> cps = Utf8::decode(item->valuestring);
    if (cps.empty()) {
        throw std::runtime_error("Config: alphabet[" + std::to_string(index) + "] is empty");
    }
    if (cps.size() != 1) {
        // Multi-code-point clusters (ZWJ sequences, flags, variation selectors)
        // cannot be represented as one token.
        throw InvalidTokenError(cps.front());
    }
    return cps.front();
}

Alphabet read_alphabet(const cJSON* node)
{
    if (cJSON_IsString(node) && node->valuestring != nullptr) {
        return Alphabet::from_utf8(node->valuestring);
    }

    if (!cJSON_IsArray(node)) {
        throw std::runtime_error("Config: 'alphabet' must be a string or an array of strings");
    }

    std::vector<char32_t> symbols;
    symbols.reserve(static_cast<std::size_t>(cJSON_GetArraySize(node)));

    int index = 0;
    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, node)
    {
        symbols.push_back(single_symbol(item, index++));
    }
    return Alphabet(std::move(symbols));
}

} // namespace

Config parse_config(const std::string& json)
{
    ScopedJson root(cJSON_Parse(json.c_str()));
    if (!root.get()) {
        throw std::runtime_error("Config: invalid JSON syntax");
    }
    if (!cJSON_IsObject(root.get())) {
        throw std::runtime_error("Config: root must be a JSON object");
    }

    Config config;

    const cJSON* alphabet = cJSON_GetObjectItemCaseSensitive(root.get(), "alphabet");
    if (alphabet && !cJSON_IsNull(alphabet)) {
        config.alphabet = read_alphabet(alphabet);
    }

    const cJSON* level = cJSON_GetObjectItemCaseSensitive(root.get(), "log_level");
    if (level && !cJSON_IsNull(level)) {
        if (!cJSON_IsString(level) || level->valuestring == nullptr) {
            throw std::runtime_error("Config: 'log_level' must be a string");
        }
        try {
            config.log_level = Logger::parse_level(level->valuestring);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Config: ") + e.what());
        }
    }

    return config;
}

Config load_config(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Config: cannot open '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Config config = parse_config(buffer.str());
    Logger::log(LogLevel::INFO, "Config: Loaded '" + path + "' (" +
                                    std::to_string(config.alphabet.size()) +
                                    "-entry alphabet).");
    return config;
}

void apply(const Config& config)
{
    Logger::set_level(config.log_level);
}

} // namespace emojid::infra
