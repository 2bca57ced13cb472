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
 * @file registry_test.cpp
 * @brief Unit tests for the registry mint transition.
 *
 * @details
 * Every failing mint is checked against a byte-level snapshot of the store
 * taken before the call, so a partial write shows up as a diff.
 */

#include "doubles.hpp"
#include "framework.hpp"
#include "kitties/storage/kv_store.hpp"
#include "kitties/storage/registry.hpp"

#include <limits>
#include <string>

using kitties::runtime::Dna;
using kitties::runtime::Error;
using kitties::runtime::Gender;
using kitties::storage::MemoryStore;
using kitties::storage::Registry;
using kitties::storage::WriteBatch;

namespace {

Dna dna_of(uint8_t tag)
{
    Dna dna{};
    dna.fill(tag);
    return dna;
}

std::string name_of(const kitties::runtime::DispatchResult& result)
{
    return kitties::runtime::error_name(result.error);
}

} // namespace

void test_registry_first_mint()
{
    MemoryStore store;
    Registry registry(store, 100);

    auto result = registry.mint("alice", dna_of(0x01), Gender::Female);
    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.dna == dna_of(0x01));

    auto kitty = registry.kitty(dna_of(0x01));
    ASSERT_TRUE(kitty.has_value());
    ASSERT_EQ(kitty->owner, std::string("alice"));
    ASSERT_TRUE(kitty->gender == Gender::Female);
    ASSERT_FALSE(kitty->price.has_value());

    ASSERT_EQ(registry.count_for_kitties(), static_cast<uint64_t>(1));
    auto owned = registry.kitties_owned("alice");
    ASSERT_EQ(owned.size(), static_cast<size_t>(1));
    ASSERT_TRUE(owned[0] == dna_of(0x01));
}

void test_registry_empty_reads()
{
    MemoryStore store;
    Registry registry(store, 100);
    ASSERT_EQ(registry.count_for_kitties(), static_cast<uint64_t>(0));
    ASSERT_FALSE(registry.kitty(dna_of(0x09)).has_value());
    ASSERT_TRUE(registry.kitties_owned("nobody").empty());
}

/**
 * @brief An existing DNA is rejected for any owner, leaving state untouched.
 */
void test_registry_duplicate_key()
{
    MemoryStore store;
    Registry registry(store, 100);
    ASSERT_TRUE(registry.mint("alice", dna_of(0x01), Gender::Male).ok());

    auto before = store.snapshot();
    auto result = registry.mint("bob", dna_of(0x01), Gender::Female);
    ASSERT_EQ(name_of(result), std::string("DuplicateKey"));
    ASSERT_TRUE(store.snapshot() == before);
    ASSERT_EQ(registry.kitty(dna_of(0x01))->owner, std::string("alice"));
}

void test_registry_owner_capacity()
{
    MemoryStore store;
    Registry registry(store, 2);
    ASSERT_TRUE(registry.mint("alice", dna_of(0x01), Gender::Male).ok());
    ASSERT_TRUE(registry.mint("alice", dna_of(0x02), Gender::Male).ok());

    auto before = store.snapshot();
    auto result = registry.mint("alice", dna_of(0x03), Gender::Male);
    ASSERT_EQ(name_of(result), std::string("OwnerCapacityExceeded"));
    ASSERT_TRUE(store.snapshot() == before);
    ASSERT_FALSE(registry.kitty(dna_of(0x03)).has_value());

    // The limit is per owner.
    ASSERT_TRUE(registry.mint("bob", dna_of(0x03), Gender::Male).ok());
    ASSERT_EQ(registry.count_for_kitties(), static_cast<uint64_t>(3));
}

void test_registry_zero_capacity()
{
    MemoryStore store;
    Registry registry(store, 0);
    ASSERT_EQ(name_of(registry.mint("alice", dna_of(0x01), Gender::Male)),
              std::string("OwnerCapacityExceeded"));
    ASSERT_EQ(store.size(), static_cast<size_t>(0));
}

/**
 * @brief A counter at u64::MAX refuses to wrap.
 */
void test_registry_counter_overflow()
{
    MemoryStore store;
    WriteBatch seed;
    seed.put(Registry::count_key(), Registry::encode_count(std::numeric_limits<uint64_t>::max()));
    ASSERT_TRUE(store.commit(seed));

    Registry registry(store, 100);
    auto before = store.snapshot();
    auto result = registry.mint("alice", dna_of(0x01), Gender::Male);
    ASSERT_EQ(name_of(result), std::string("CounterOverflow"));
    ASSERT_TRUE(store.snapshot() == before);
    ASSERT_EQ(registry.count_for_kitties(), std::numeric_limits<uint64_t>::max());
}

void test_registry_counter_at_boundary()
{
    MemoryStore store;
    WriteBatch seed;
    seed.put(Registry::count_key(),
             Registry::encode_count(std::numeric_limits<uint64_t>::max() - 1));
    ASSERT_TRUE(store.commit(seed));

    Registry registry(store, 100);
    ASSERT_TRUE(registry.mint("alice", dna_of(0x01), Gender::Male).ok());
    ASSERT_EQ(registry.count_for_kitties(), std::numeric_limits<uint64_t>::max());
    ASSERT_EQ(name_of(registry.mint("alice", dna_of(0x02), Gender::Male)),
              std::string("CounterOverflow"));
}

/**
 * @brief A duplicate DNA reports DuplicateKey even when the owner is also full.
 */
void test_registry_check_order()
{
    MemoryStore store;
    Registry registry(store, 1);
    ASSERT_TRUE(registry.mint("alice", dna_of(0x01), Gender::Male).ok());
    ASSERT_EQ(name_of(registry.mint("alice", dna_of(0x01), Gender::Male)),
              std::string("DuplicateKey"));
}

/**
 * @brief After N successes and M failures the counter equals N and the
 * ownership lists partition the kitties.
 */
void test_registry_counter_consistency()
{
    MemoryStore store;
    Registry registry(store, 3);
    const char* owners[] = {"alice", "bob", "carol"};

    int successes = 0;
    int failures = 0;
    for (uint8_t i = 0; i < 12; i++) {
        auto result = registry.mint(owners[i % 3], dna_of(i), Gender::Male);
        if (result.ok())
            successes++;
        else
            failures++;
    }
    // Replay a few DNAs that already exist.
    for (uint8_t i = 0; i < 3; i++) {
        if (!registry.mint("dave", dna_of(i), Gender::Male).ok())
            failures++;
    }

    ASSERT_EQ(successes, 9);
    ASSERT_EQ(failures, 6);
    ASSERT_EQ(registry.count_for_kitties(), static_cast<uint64_t>(successes));

    size_t listed = 0;
    for (const char* owner : owners) {
        for (const auto& dna : registry.kitties_owned(owner)) {
            ASSERT_EQ(registry.kitty(dna)->owner, std::string(owner));
            listed++;
        }
    }
    ASSERT_EQ(listed, static_cast<size_t>(successes));
    ASSERT_TRUE(registry.kitties_owned("dave").empty());
}

/**
 * @brief Repeating a failing call yields the same error and the same state.
 */
void test_registry_failure_is_idempotent()
{
    MemoryStore store;
    Registry registry(store, 1);
    ASSERT_TRUE(registry.mint("alice", dna_of(0x01), Gender::Male).ok());

    auto before = store.snapshot();
    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(name_of(registry.mint("alice", dna_of(0x02), Gender::Male)),
                  std::string("OwnerCapacityExceeded"));
        ASSERT_TRUE(store.snapshot() == before);
    }
}

void test_registry_storage_failure()
{
    kitties::test::FailingStore store;
    store.fail_commits = true;
    Registry registry(store, 100);

    ASSERT_EQ(name_of(registry.mint("alice", dna_of(0x01), Gender::Male)),
              std::string("StorageFailure"));
    ASSERT_EQ(store.inner.size(), static_cast<size_t>(0));

    store.fail_commits = false;
    ASSERT_TRUE(registry.mint("alice", dna_of(0x01), Gender::Male).ok());
}

/**
 * @brief Ownership lists keep mint order.
 */
void test_registry_owned_order()
{
    MemoryStore store;
    Registry registry(store, 10);
    ASSERT_TRUE(registry.mint("alice", dna_of(0x30), Gender::Male).ok());
    ASSERT_TRUE(registry.mint("alice", dna_of(0x10), Gender::Male).ok());
    ASSERT_TRUE(registry.mint("alice", dna_of(0x20), Gender::Male).ok());

    auto owned = registry.kitties_owned("alice");
    ASSERT_EQ(owned.size(), static_cast<size_t>(3));
    ASSERT_TRUE(owned[0] == dna_of(0x30));
    ASSERT_TRUE(owned[1] == dna_of(0x10));
    ASSERT_TRUE(owned[2] == dna_of(0x20));
}
