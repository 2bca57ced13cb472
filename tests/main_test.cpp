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
 * @brief Central orchestrator for the kitty registry test suite.
 *
 * @details
 * Aggregates the unit and integration tests of every layer:
 * Infrastructure, Storage, Registry, Runtime and Dispatcher.
 */

#include "framework.hpp"
#include "kitties/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_hex_encoding();
void test_hex_rejects_malformed();
void test_codec_little_endian();
void test_blake2_reference_vectors();
void test_config_defaults();
void test_config_overrides();
void test_config_rejects_bad_values();
void test_log_level_parse();
void test_shutdown_signal_handling();

// Key-Value Backends (storage_test.cpp)
void test_memory_store_batch();
void test_log_store_replay();
void test_log_store_torn_tail();
void test_log_store_rejects_corrupt_frame();
void test_log_store_registry_corrupt_first_mint();
void test_log_store_drops_undecodable_tail();
void test_log_store_oversized_length_header();
void test_log_store_unserializable_batch();
void test_log_store_compaction();

// Registry Store (registry_test.cpp)
void test_registry_first_mint();
void test_registry_empty_reads();
void test_registry_duplicate_key();
void test_registry_owner_capacity();
void test_registry_zero_capacity();
void test_registry_counter_overflow();
void test_registry_counter_at_boundary();
void test_registry_check_order();
void test_registry_counter_consistency();
void test_registry_failure_is_idempotent();
void test_registry_storage_failure();
void test_registry_owned_order();

// Runtime (runtime_test.cpp)
void test_id_generator_deterministic();
void test_id_generator_payload_layout();
void test_id_generator_gender_rule();
void test_id_generator_without_extrinsic();
void test_chain_extrinsic_indices();
void test_chain_material_window();
void test_collective_flip_genesis();
void test_collective_flip_deterministic();
void test_collective_flip_block_marker();
void test_chain_attach_restores_head();
void test_chain_attach_rejects_malformed_head();
void test_chain_seal_keeps_head_on_save_failure();
void test_create_kitty_emits_created();
void test_create_kitty_requires_signed_origin();
void test_create_kitty_forced_collision();
void test_create_kitty_capacity_plus_one();
void test_create_kitty_on_chain();

// Dispatcher (dispatcher_test.cpp)
void test_dispatch_create_kitty();
void test_dispatch_bad_requests();
void test_dispatch_unsigned_origin();
void test_dispatch_capacity_error();
void test_dispatch_queries();
void test_dispatch_seal_block();
void test_dispatch_seal_block_storage_failure();
void test_dispatch_fault_closes_extrinsic();
void test_dispatch_unserializable_response();
void test_dispatch_call_table();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return 0 when every test passed, 1 otherwise.
 */
int main()
{
    // Rejected calls log at WARN and would interleave with the report.
    kitties::infra::Logger::set_level(kitties::infra::LogLevel::FATAL);

    std::cout << "\033[36mInitiating Kitty Registry Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_hex_encoding);
    RUN_TEST(test_hex_rejects_malformed);
    RUN_TEST(test_codec_little_endian);
    RUN_TEST(test_blake2_reference_vectors);
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_overrides);
    RUN_TEST(test_config_rejects_bad_values);
    RUN_TEST(test_log_level_parse);
    RUN_TEST(test_shutdown_signal_handling);

    // --- 2. Key-Value Backends ---
    // Frame replay, torn tails and compaction.
    RUN_TEST(test_memory_store_batch);
    RUN_TEST(test_log_store_replay);
    RUN_TEST(test_log_store_torn_tail);
    RUN_TEST(test_log_store_rejects_corrupt_frame);
    RUN_TEST(test_log_store_registry_corrupt_first_mint);
    RUN_TEST(test_log_store_drops_undecodable_tail);
    RUN_TEST(test_log_store_oversized_length_header);
    RUN_TEST(test_log_store_unserializable_batch);
    RUN_TEST(test_log_store_compaction);

    // --- 3. Registry Store ---
    RUN_TEST(test_registry_first_mint);
    RUN_TEST(test_registry_empty_reads);
    RUN_TEST(test_registry_duplicate_key);
    RUN_TEST(test_registry_owner_capacity);
    RUN_TEST(test_registry_zero_capacity);
    RUN_TEST(test_registry_counter_overflow);
    RUN_TEST(test_registry_counter_at_boundary);
    RUN_TEST(test_registry_check_order);
    RUN_TEST(test_registry_counter_consistency);
    RUN_TEST(test_registry_failure_is_idempotent);
    RUN_TEST(test_registry_storage_failure);
    RUN_TEST(test_registry_owned_order);

    // --- 4. Runtime ---
    RUN_TEST(test_id_generator_deterministic);
    RUN_TEST(test_id_generator_payload_layout);
    RUN_TEST(test_id_generator_gender_rule);
    RUN_TEST(test_id_generator_without_extrinsic);
    RUN_TEST(test_chain_extrinsic_indices);
    RUN_TEST(test_chain_material_window);
    RUN_TEST(test_collective_flip_genesis);
    RUN_TEST(test_collective_flip_deterministic);
    RUN_TEST(test_collective_flip_block_marker);
    RUN_TEST(test_chain_attach_restores_head);
    RUN_TEST(test_chain_attach_rejects_malformed_head);
    RUN_TEST(test_chain_seal_keeps_head_on_save_failure);
    RUN_TEST(test_create_kitty_emits_created);
    RUN_TEST(test_create_kitty_requires_signed_origin);
    RUN_TEST(test_create_kitty_forced_collision);
    RUN_TEST(test_create_kitty_capacity_plus_one);
    RUN_TEST(test_create_kitty_on_chain);

    // --- 5. Dispatcher ---
    // JSON-In -> Runtime-Execute -> JSON-Out.
    RUN_TEST(test_dispatch_create_kitty);
    RUN_TEST(test_dispatch_bad_requests);
    RUN_TEST(test_dispatch_unsigned_origin);
    RUN_TEST(test_dispatch_capacity_error);
    RUN_TEST(test_dispatch_queries);
    RUN_TEST(test_dispatch_seal_block);
    RUN_TEST(test_dispatch_seal_block_storage_failure);
    RUN_TEST(test_dispatch_fault_closes_extrinsic);
    RUN_TEST(test_dispatch_unserializable_response);
    RUN_TEST(test_dispatch_call_table);

    kitties::test::print_summary();

    return (kitties::test::failed_count == 0) ? 0 : 1;
}
