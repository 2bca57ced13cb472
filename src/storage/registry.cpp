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
 * @file registry.cpp
 * @brief Implementation of the kitty registry.
 *
 * @details
 * Sequence of a mint: Check DNA -> Check Counter -> Check Capacity ->
 * Stage Writes -> Atomic Commit. Reads made by the checks and the staged
 * writes see the same snapshot because transitions are applied one at a time.
 */

#include "kitties/storage/registry.hpp"

#include "kitties/infra/codec.hpp"
#include "kitties/infra/logger.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace kitties::storage {

namespace {

const char kCountKey[] = "CountForKitties";
const char kKittyPrefix[] = "Kitties/";
const char kOwnedPrefix[] = "KittiesOwned/";

std::string print_and_free(cJSON* node)
{
    char* raw = cJSON_PrintUnformatted(node);
    std::string out(raw ? raw : "");
    free(raw);
    cJSON_Delete(node);
    return out;
}

} // namespace

Registry::Registry(KvStore& store, uint32_t max_kitties_owned)
    : store_(store), max_kitties_owned_(max_kitties_owned)
{
}

std::string Registry::count_key()
{
    return kCountKey;
}

std::string Registry::kitty_key(const runtime::Dna& dna)
{
    return kKittyPrefix + runtime::dna_bytes(dna);
}

std::string Registry::owned_key(const runtime::AccountId& owner)
{
    return kOwnedPrefix + owner;
}

std::string Registry::encode_count(uint64_t count)
{
    std::string out;
    infra::Codec::put_u64_le(out, count);
    return out;
}

std::string Registry::encode_kitty(const runtime::Kitty& kitty)
{
    cJSON* doc = cJSON_CreateObject();
    cJSON_AddStringToObject(doc, "dna", runtime::dna_hex(kitty.dna).c_str());
    if (kitty.price) {
        // Decimal string: a double cannot carry every u64 balance.
        cJSON_AddStringToObject(doc, "price", std::to_string(*kitty.price).c_str());
    } else {
        cJSON_AddNullToObject(doc, "price");
    }
    cJSON_AddStringToObject(doc, "gender", runtime::gender_name(kitty.gender));
    cJSON_AddStringToObject(doc, "owner", kitty.owner.c_str());
    return print_and_free(doc);
}

std::string Registry::encode_owned(const std::vector<runtime::Dna>& owned)
{
    cJSON* arr = cJSON_CreateArray();
    for (const auto& dna : owned) {
        cJSON_AddItemToArray(arr, cJSON_CreateString(runtime::dna_hex(dna).c_str()));
    }
    return print_and_free(arr);
}

bool Registry::decode_kitty(const std::string& raw, runtime::Kitty& out)
{
    cJSON* doc = cJSON_Parse(raw.c_str());
    if (!doc) {
        return false;
    }

    runtime::Kitty kitty;
    cJSON* dna = cJSON_GetObjectItem(doc, "dna");
    cJSON* price = cJSON_GetObjectItem(doc, "price");
    cJSON* gender = cJSON_GetObjectItem(doc, "gender");
    cJSON* owner = cJSON_GetObjectItem(doc, "owner");

    bool ok = cJSON_IsString(dna) && runtime::parse_dna(dna->valuestring, kitty.dna) &&
              cJSON_IsString(gender) && cJSON_IsString(owner);
    if (ok) {
        std::string g = gender->valuestring;
        if (g == "Male")
            kitty.gender = runtime::Gender::Male;
        else if (g == "Female")
            kitty.gender = runtime::Gender::Female;
        else
            ok = false;
        kitty.owner = owner->valuestring;
    }
    if (ok && cJSON_IsString(price)) {
        char* end = nullptr;
        unsigned long long v = std::strtoull(price->valuestring, &end, 10);
        if (end == price->valuestring || *end != '\0')
            ok = false;
        else
            kitty.price = static_cast<runtime::Balance>(v);
    } else if (ok && price && !cJSON_IsNull(price)) {
        ok = false;
    }
    cJSON_Delete(doc);

    if (ok) {
        out = std::move(kitty);
    }
    return ok;
}

bool Registry::decode_owned(const std::string& raw, std::vector<runtime::Dna>& out)
{
    cJSON* arr = cJSON_Parse(raw.c_str());
    if (!cJSON_IsArray(arr)) {
        cJSON_Delete(arr);
        return false;
    }

    std::vector<runtime::Dna> owned;
    bool ok = true;
    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, arr)
    {
        runtime::Dna dna{};
        if (!cJSON_IsString(item) || !runtime::parse_dna(item->valuestring, dna)) {
            ok = false;
            break;
        }
        owned.push_back(dna);
    }
    cJSON_Delete(arr);

    if (ok) {
        out = std::move(owned);
    }
    return ok;
}

uint64_t Registry::count_for_kitties() const
{
    auto raw = store_.get(count_key());
    if (!raw) {
        return 0;
    }
    uint64_t count = 0;
    if (!infra::Codec::get_u64_le(*raw, count)) {
        throw std::runtime_error("Registry: Corrupt CountForKitties value");
    }
    return count;
}

std::optional<runtime::Kitty> Registry::kitty(const runtime::Dna& dna) const
{
    auto raw = store_.get(kitty_key(dna));
    if (!raw) {
        return std::nullopt;
    }
    runtime::Kitty kitty;
    if (!decode_kitty(*raw, kitty)) {
        throw std::runtime_error("Registry: Corrupt record for kitty " + runtime::dna_hex(dna));
    }
    return kitty;
}

std::vector<runtime::Dna> Registry::kitties_owned(const runtime::AccountId& owner) const
{
    std::vector<runtime::Dna> owned;
    auto raw = store_.get(owned_key(owner));
    if (raw && !decode_owned(*raw, owned)) {
        throw std::runtime_error("Registry: Corrupt ownership list for " + owner);
    }
    return owned;
}

runtime::DispatchResult Registry::mint(const runtime::AccountId& owner, const runtime::Dna& dna,
                                       runtime::Gender gender)
{
    const std::string hex = runtime::dna_hex(dna);

    // A duplicate means the generator broke its contract; report it before capacity.
    if (store_.contains(kitty_key(dna))) {
        infra::Logger::log(infra::LogLevel::WARN, "Registry: Rejected duplicate DNA " + hex);
        return runtime::DispatchResult::failure(runtime::Error::DuplicateKey);
    }

    uint64_t count = count_for_kitties();
    if (count == std::numeric_limits<uint64_t>::max()) {
        infra::Logger::log(infra::LogLevel::WARN, "Registry: Kitty counter would overflow");
        return runtime::DispatchResult::failure(runtime::Error::CounterOverflow);
    }
    uint64_t new_count = count + 1;

    std::vector<runtime::Dna> owned = kitties_owned(owner);
    if (owned.size() >= max_kitties_owned_) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Registry: " + owner + " already owns " + std::to_string(owned.size()) +
                               " kitties (limit " + std::to_string(max_kitties_owned_) + ")");
        return runtime::DispatchResult::failure(runtime::Error::OwnerCapacityExceeded);
    }
    owned.push_back(dna);

    runtime::Kitty kitty;
    kitty.dna = dna;
    kitty.gender = gender;
    kitty.owner = owner;

    WriteBatch batch;
    batch.put(kitty_key(dna), encode_kitty(kitty));
    batch.put(owned_key(owner), encode_owned(owned));
    batch.put(count_key(), encode_count(new_count));

    if (!store_.commit(batch)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Registry: Commit failed for kitty " + hex);
        return runtime::DispatchResult::failure(runtime::Error::StorageFailure);
    }

    infra::Logger::log(infra::LogLevel::DEBUG, "Registry: Minted " + hex + " (" +
                                                   runtime::gender_name(gender) + ") for " +
                                                   owner + ", total " + std::to_string(new_count));
    return runtime::DispatchResult::success(dna);
}

} // namespace kitties::storage
