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
 * @file dispatcher_test.cpp
 * @brief Integration tests for the JSON call dispatcher.
 *
 * @details
 * Drives the full pipeline (JSON-In -> Runtime-Execute -> JSON-Out) against
 * an in-memory store and checks status, error names and payload fields.
 */

#include "doubles.hpp"
#include "framework.hpp"
#include "kitties/network/dispatcher.hpp"
#include "kitties/runtime/chain.hpp"
#include "kitties/runtime/event_log.hpp"
#include "kitties/runtime/pallet.hpp"
#include "kitties/storage/kv_store.hpp"

#include <cJSON.h>
#include <string>

using kitties::network::Dispatcher;

namespace {

/// @brief In-memory runtime with a dispatcher in front of it.
struct Harness {
    kitties::storage::MemoryStore store;
    kitties::runtime::Chain chain;
    kitties::runtime::CollectiveFlip randomness{chain};
    kitties::runtime::EventLog events;
    kitties::runtime::Pallet pallet{kitties::runtime::PalletConfig{2, randomness, events}, chain,
                                    store};
    Dispatcher dispatcher{pallet, chain, events};
};

/// @brief Runtime whose store and entropy source fail on demand.
struct FaultHarness {
    kitties::test::FailingStore store;
    kitties::runtime::Chain chain;
    kitties::test::ThrowingRandomness randomness;
    kitties::runtime::EventLog events;
    kitties::runtime::Pallet pallet{kitties::runtime::PalletConfig{2, randomness, events}, chain,
                                    store};
    Dispatcher dispatcher{pallet, chain, events};

    FaultHarness() { chain.attach(store); }
};

/// @brief Owns a parsed response for the duration of a test.
class Response {
  public:
    explicit Response(const std::string& raw) : root_(cJSON_Parse(raw.c_str())) {}
    ~Response() { cJSON_Delete(root_); }
    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    bool valid() const { return root_ != nullptr; }

    std::string str(const char* field) const
    {
        const cJSON* node = cJSON_GetObjectItem(root_, field);
        return cJSON_IsString(node) ? node->valuestring : "";
    }

    const cJSON* item(const char* field) const { return cJSON_GetObjectItem(root_, field); }

  private:
    cJSON* root_;
};

const char kCreateAlice[] = R"({"call":"create_kitty","origin":{"signed":"alice"}})";

} // namespace

void test_dispatch_create_kitty()
{
    Harness h;
    Response resp(h.dispatcher.process(kCreateAlice));
    ASSERT_TRUE(resp.valid());
    ASSERT_EQ(resp.str("status"), std::string("ok"));
    ASSERT_EQ(resp.str("dna").size(), static_cast<size_t>(32));
    std::string gender = resp.str("gender");
    ASSERT_TRUE(gender == "Male" || gender == "Female");

    const cJSON* events = resp.item("events");
    ASSERT_TRUE(cJSON_IsArray(events));
    ASSERT_EQ(cJSON_GetArraySize(events), 1);
    const cJSON* created = cJSON_GetArrayItem(events, 0);
    ASSERT_EQ(std::string(cJSON_GetObjectItem(created, "event")->valuestring),
              std::string("Created"));
    ASSERT_EQ(std::string(cJSON_GetObjectItem(created, "kitty")->valuestring), resp.str("dna"));
    ASSERT_EQ(std::string(cJSON_GetObjectItem(created, "owner")->valuestring),
              std::string("alice"));

    ASSERT_EQ(h.chain.extrinsic_count(), static_cast<uint32_t>(1));
}

/**
 * @brief Syntax and shape errors never reach the runtime.
 */
void test_dispatch_bad_requests()
{
    Harness h;
    const char* inputs[] = {"", "{ \"call\": ", "[1,2]"};
    for (const char* input : inputs) {
        Response resp(h.dispatcher.process(input));
        ASSERT_EQ(resp.str("status"), std::string("error"));
        ASSERT_EQ(resp.str("error"), std::string("BadRequest"));
    }

    Response bad_origin(h.dispatcher.process(R"({"call":"create_kitty","origin":5})"));
    ASSERT_EQ(bad_origin.str("error"), std::string("BadRequest"));
    ASSERT_EQ(h.chain.extrinsic_count(), static_cast<uint32_t>(0));

    Response unknown(h.dispatcher.process(R"({"call":"transfer"})"));
    ASSERT_EQ(unknown.str("error"), std::string("UnknownCall"));
}

void test_dispatch_unsigned_origin()
{
    Harness h;
    const char* requests[] = {R"({"call":"create_kitty"})",
                              R"({"call":"create_kitty","origin":"root"})",
                              R"({"call":"create_kitty","origin":"none"})"};
    for (const char* request : requests) {
        Response resp(h.dispatcher.process(request));
        ASSERT_EQ(resp.str("status"), std::string("error"));
        ASSERT_EQ(resp.str("error"), std::string("UnauthenticatedOrigin"));
        ASSERT_EQ(cJSON_GetArraySize(resp.item("events")), 0);
    }

    Response count(h.dispatcher.process(R"({"call":"count_kitties"})"));
    ASSERT_EQ(count.str("count"), std::string("0"));
}

/**
 * @brief The configured limit of two surfaces as OwnerCapacityExceeded.
 */
void test_dispatch_capacity_error()
{
    Harness h;
    ASSERT_EQ(Response(h.dispatcher.process(kCreateAlice)).str("status"), std::string("ok"));
    ASSERT_EQ(Response(h.dispatcher.process(kCreateAlice)).str("status"), std::string("ok"));

    Response third(h.dispatcher.process(kCreateAlice));
    ASSERT_EQ(third.str("error"), std::string("OwnerCapacityExceeded"));

    Response count(h.dispatcher.process(R"({"call":"count_kitties"})"));
    ASSERT_EQ(count.str("count"), std::string("2"));
}

void test_dispatch_queries()
{
    Harness h;
    Response created(h.dispatcher.process(kCreateAlice));
    std::string dna = created.str("dna");

    Response kitty(h.dispatcher.process(R"({"call":"get_kitty","dna":")" + dna + "\"}"));
    ASSERT_EQ(kitty.str("status"), std::string("ok"));
    const cJSON* record = kitty.item("kitty");
    ASSERT_EQ(std::string(cJSON_GetObjectItem(record, "owner")->valuestring),
              std::string("alice"));
    ASSERT_TRUE(cJSON_IsNull(cJSON_GetObjectItem(record, "price")));
    ASSERT_EQ(std::string(cJSON_GetObjectItem(record, "gender")->valuestring),
              created.str("gender"));

    Response owned(h.dispatcher.process(R"({"call":"kitties_owned","owner":"alice"})"));
    ASSERT_EQ(cJSON_GetArraySize(owned.item("kitties")), 1);
    ASSERT_EQ(std::string(cJSON_GetArrayItem(owned.item("kitties"), 0)->valuestring), dna);

    Response missing(h.dispatcher.process(
        R"({"call":"get_kitty","dna":"00000000000000000000000000000000"})"));
    ASSERT_EQ(missing.str("error"), std::string("NotFound"));

    Response malformed(h.dispatcher.process(R"({"call":"get_kitty","dna":"xyz"})"));
    ASSERT_EQ(malformed.str("error"), std::string("BadRequest"));

    Response no_owner(h.dispatcher.process(R"({"call":"kitties_owned"})"));
    ASSERT_EQ(no_owner.str("error"), std::string("BadRequest"));
}

void test_dispatch_seal_block()
{
    Harness h;
    h.dispatcher.process(kCreateAlice);

    Response sealed(h.dispatcher.process(R"({"call":"seal_block"})"));
    ASSERT_EQ(sealed.str("status"), std::string("ok"));
    ASSERT_TRUE(cJSON_IsNumber(sealed.item("block")));
    ASSERT_EQ(sealed.item("block")->valueint, 1);
    ASSERT_EQ(sealed.str("hash").size(), static_cast<size_t>(64));
    ASSERT_EQ(h.chain.block_number(), static_cast<uint64_t>(2));
    ASSERT_EQ(h.chain.extrinsic_count(), static_cast<uint32_t>(0));
}

void test_dispatch_seal_block_storage_failure()
{
    FaultHarness h;
    h.store.fail_commits = true;

    Response refused(h.dispatcher.process(R"({"call":"seal_block"})"));
    ASSERT_EQ(refused.str("status"), std::string("error"));
    ASSERT_EQ(refused.str("error"), std::string("StorageFailure"));
    ASSERT_TRUE(refused.item("hash") == nullptr);
    ASSERT_EQ(h.chain.block_number(), static_cast<uint64_t>(1));

    h.store.fail_commits = false;
    Response sealed(h.dispatcher.process(R"({"call":"seal_block"})"));
    ASSERT_EQ(sealed.str("status"), std::string("ok"));
    ASSERT_EQ(sealed.item("block")->valueint, 1);
    ASSERT_EQ(h.chain.block_number(), static_cast<uint64_t>(2));
}

/**
 * @brief A call that throws still closes its extrinsic.
 *
 * The next call must get the following index and must not run inside the
 * aborted one.
 */
void test_dispatch_fault_closes_extrinsic()
{
    FaultHarness h;

    Response failed(h.dispatcher.process(kCreateAlice));
    ASSERT_EQ(failed.str("status"), std::string("error"));
    ASSERT_EQ(failed.str("error"), std::string("InternalError"));
    ASSERT_FALSE(h.chain.extrinsic_index().has_value());
    ASSERT_EQ(h.chain.extrinsic_count(), static_cast<uint32_t>(1));

    Response again(h.dispatcher.process(kCreateAlice));
    ASSERT_EQ(again.str("error"), std::string("InternalError"));
    ASSERT_FALSE(h.chain.extrinsic_index().has_value());
    ASSERT_EQ(h.chain.extrinsic_count(), static_cast<uint32_t>(2));
}

void test_dispatch_unserializable_response()
{
    Harness h;
    std::string raw;
    {
        kitties::test::FailingJsonPrint failing_print;
        raw = h.dispatcher.process(R"({"call":"count_kitties"})");
    }

    Response resp(raw);
    ASSERT_TRUE(resp.valid());
    ASSERT_EQ(resp.str("status"), std::string("error"));
    ASSERT_EQ(resp.str("error"), std::string("InternalError"));
    ASSERT_EQ(resp.str("message"), std::string("Response serialization failed"));
}

void test_dispatch_call_table()
{
    Harness h;
    auto calls = h.dispatcher.calls();
    ASSERT_EQ(calls.size(), static_cast<size_t>(5));
    ASSERT_EQ(calls.front(), std::string("count_kitties"));
    ASSERT_EQ(calls.back(), std::string("seal_block"));
}
