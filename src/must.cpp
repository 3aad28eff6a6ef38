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
 * @file must.cpp
 * @brief Converts library errors into process termination.
 */

#include "emojid/must.hpp"

#include "emojid/emojid.hpp"
#include "emojid/infra/logger.hpp"

#include <cstdlib>

namespace emojid {

namespace {

[[noreturn]] void die(const char* operation, const Error& e)
{
    infra::Logger::log(infra::LogLevel::FATAL, std::string("Must: ") + operation + " failed (" +
                                                   to_string(e.code()) + "): " + e.what());
    std::abort();
}

} // namespace

Identifier must_generate()
{
    try {
        return generate();
    } catch (const Error& e) {
        die("generate", e);
    }
}

std::string must_generate_string()
{
    return format(must_generate());
}

Identifier must_parse(std::string_view s)
{
    try {
        return parse(s);
    } catch (const Error& e) {
        die("parse", e);
    }
}

} // namespace emojid
