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
 * @file main_test.cpp
 * @brief Central orchestrator for the emojid test suite.
 *
 * @details
 * Aggregates the unit tests of every subsystem: infrastructure, sampler,
 * identifier and alphabet, codec, and configuration.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_utf8_encode_lengths();
void test_utf8_decode_valid();
void test_utf8_decode_malformed();
void test_utf8_scalar_values();
void test_logger_parse_level();
void test_logger_threshold();

// Sampler (sampler_test.cpp)
void test_sampler_big_endian_draw();
void test_sampler_rejects_top_of_range();
void test_sampler_accepts_just_below_limit();
void test_sampler_wide_range();
void test_sampler_range_too_small();
void test_sampler_entropy_failure_propagates();
void test_sampler_default_count();
void test_sampler_uniformity();
void test_system_entropy_fills_buffer();

// Identifier, Alphabet and generation API (identifier_test.cpp)
void test_identifier_zero_value();
void test_identifier_generated_not_zero();
void test_identifier_equality();
void test_identifier_tokens_copy();
void test_identifier_to_string();
void test_alphabet_default_contents();
void test_alphabet_from_utf8();
void test_alphabet_rejects_reserved_entries();
void test_alphabet_accepts_duplicates();
void test_generate_alphabet_too_small();
void test_generate_uses_only_alphabet_symbols();
void test_generate_entropy_failure();
void test_generate_string_parses();
void test_must_variants_success_path();

// Codec (codec_test.cpp)
void test_codec_scripted_example();
void test_codec_round_trip_default_alphabet();
void test_codec_round_trip_custom_alphabet();
void test_codec_format_shape();
void test_codec_invalid_group_count();
void test_codec_invalid_group_length();
void test_codec_counts_code_points();
void test_codec_invalid_token();
void test_codec_first_invalid_token_reported();
void test_codec_shape_checked_before_membership();
void test_codec_alphabet_checked_first();
void test_codec_malformed_utf8();
void test_codec_validate();
void test_codec_zero_identifier_format();

// Configuration (config_test.cpp)
void test_config_defaults();
void test_config_string_alphabet();
void test_config_array_alphabet();
void test_config_errors();
void test_config_rejects_multi_unit_entry();
void test_config_load_file();
void test_config_apply();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating emojid Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    RUN_TEST(test_utf8_encode_lengths);
    RUN_TEST(test_utf8_decode_valid);
    RUN_TEST(test_utf8_decode_malformed);
    RUN_TEST(test_utf8_scalar_values);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);

    // --- 2. Sampler ---
    RUN_TEST(test_sampler_big_endian_draw);
    RUN_TEST(test_sampler_rejects_top_of_range);
    RUN_TEST(test_sampler_accepts_just_below_limit);
    RUN_TEST(test_sampler_wide_range);
    RUN_TEST(test_sampler_range_too_small);
    RUN_TEST(test_sampler_entropy_failure_propagates);
    RUN_TEST(test_sampler_default_count);
    RUN_TEST(test_sampler_uniformity);
    RUN_TEST(test_system_entropy_fills_buffer);

    // --- 3. Identifier, Alphabet and generation ---
    RUN_TEST(test_identifier_zero_value);
    RUN_TEST(test_identifier_generated_not_zero);
    RUN_TEST(test_identifier_equality);
    RUN_TEST(test_identifier_tokens_copy);
    RUN_TEST(test_identifier_to_string);
    RUN_TEST(test_alphabet_default_contents);
    RUN_TEST(test_alphabet_from_utf8);
    RUN_TEST(test_alphabet_rejects_reserved_entries);
    RUN_TEST(test_alphabet_accepts_duplicates);
    RUN_TEST(test_generate_alphabet_too_small);
    RUN_TEST(test_generate_uses_only_alphabet_symbols);
    RUN_TEST(test_generate_entropy_failure);
    RUN_TEST(test_generate_string_parses);
    RUN_TEST(test_must_variants_success_path);

    // --- 4. Codec ---
    RUN_TEST(test_codec_scripted_example);
    RUN_TEST(test_codec_round_trip_default_alphabet);
    RUN_TEST(test_codec_round_trip_custom_alphabet);
    RUN_TEST(test_codec_format_shape);
    RUN_TEST(test_codec_invalid_group_count);
    RUN_TEST(test_codec_invalid_group_length);
    RUN_TEST(test_codec_counts_code_points);
    RUN_TEST(test_codec_invalid_token);
    RUN_TEST(test_codec_first_invalid_token_reported);
    RUN_TEST(test_codec_shape_checked_before_membership);
    RUN_TEST(test_codec_alphabet_checked_first);
    RUN_TEST(test_codec_malformed_utf8);
    RUN_TEST(test_codec_validate);
    RUN_TEST(test_codec_zero_identifier_format);

    // --- 5. Configuration ---
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_string_alphabet);
    RUN_TEST(test_config_array_alphabet);
    RUN_TEST(test_config_errors);
    RUN_TEST(test_config_rejects_multi_unit_entry);
    RUN_TEST(test_config_load_file);
    RUN_TEST(test_config_apply);

    emojid::test::print_summary();

    return (emojid::test::failed_count == 0) ? 0 : 1;
}
