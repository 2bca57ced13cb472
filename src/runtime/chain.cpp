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

#include "kitties/runtime/chain.hpp"

#include "kitties/infra/codec.hpp"
#include "kitties/infra/logger.hpp"
#include "kitties/infra/string.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace kitties::runtime {

namespace {

const char kNumberKey[] = "System/Number";
const char kParentHashKey[] = "System/ParentHash";
const char kRandomMaterialKey[] = "System/RandomMaterial";

std::string hash_bytes(const infra::Hash256& hash)
{
    return std::string(reinterpret_cast<const char*>(hash.data()), hash.size());
}

} // namespace

Chain::Chain(uint64_t first_block) : block_number_(first_block) {}

void Chain::attach(storage::KvStore& store)
{
    store_ = &store;

    auto number = store.get(kNumberKey);
    if (!number) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Chain: No saved head, starting at block #" +
                                                       std::to_string(block_number_));
        return;
    }

    auto parent = store.get(kParentHashKey);
    auto material = store.get(kRandomMaterialKey);
    uint64_t restored = 0;
    if (!infra::Codec::get_u64_le(*number, restored) || !parent ||
        parent->size() != parent_hash_.size() || !material ||
        material->size() % parent_hash_.size() != 0) {
        throw std::runtime_error("Chain: Saved head is malformed");
    }

    block_number_ = restored;
    std::copy(parent->begin(), parent->end(), parent_hash_.begin());
    random_material_.clear();
    for (size_t off = 0; off < material->size(); off += parent_hash_.size()) {
        infra::Hash256 hash{};
        std::copy_n(material->begin() + static_cast<std::ptrdiff_t>(off), hash.size(), hash.begin());
        random_material_.push_back(hash);
    }
    infra::Logger::log(infra::LogLevel::INFO,
                       "Chain: Resumed at block #" + std::to_string(block_number_));
}

bool Chain::save_head(uint64_t number, const infra::Hash256& parent,
                      const std::deque<infra::Hash256>& material)
{
    std::string encoded_number;
    infra::Codec::put_u64_le(encoded_number, number);
    std::string encoded_material;
    for (const auto& hash : material) {
        encoded_material += hash_bytes(hash);
    }

    storage::WriteBatch batch;
    batch.put(kNumberKey, encoded_number);
    batch.put(kParentHashKey, hash_bytes(parent));
    batch.put(kRandomMaterialKey, encoded_material);
    return store_->commit(batch);
}

void Chain::begin_extrinsic()
{
    current_index_ = extrinsic_count_;
}

void Chain::end_extrinsic()
{
    if (current_index_) {
        extrinsic_count_++;
        current_index_.reset();
    }
}

std::optional<infra::Hash256> Chain::seal_block()
{
    end_extrinsic();

    std::string header = hash_bytes(parent_hash_);
    infra::Codec::put_u64_le(header, block_number_);
    infra::Codec::put_u32_le(header, extrinsic_count_);
    infra::Hash256 hash = infra::Hasher::blake2_256(header);

    std::deque<infra::Hash256> material = random_material_;
    material.push_back(hash);
    if (material.size() > kRandomMaterialLen) {
        material.pop_front();
    }

    if (store_ && !save_head(block_number_ + 1, hash, material)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Chain: Failed to save head, block #" +
                                                       std::to_string(block_number_) +
                                                       " stays open");
        return std::nullopt;
    }

    infra::Logger::log(infra::LogLevel::INFO,
                       "Chain: Sealed block #" + std::to_string(block_number_) + " with " +
                           std::to_string(extrinsic_count_) + " extrinsics, hash " +
                           infra::String::to_hex(hash_bytes(hash)));

    random_material_ = std::move(material);
    parent_hash_ = hash;
    block_number_++;
    extrinsic_count_ = 0;
    return hash;
}

CollectiveFlip::CollectiveFlip(const Chain& chain) : chain_(chain) {}

RandomOutput CollectiveFlip::random(const std::string& subject) const
{
    RandomOutput out;
    uint64_t block = chain_.block_number();
    out.block_marker = block > Chain::kRandomMaterialLen ? block - Chain::kRandomMaterialLen : 0;

    const auto& material = chain_.random_material();
    if (material.empty()) {
        return out;
    }

    std::string input = subject;
    uint8_t position = 0;
    for (const auto& hash : material) {
        input.push_back(static_cast<char>(position++));
        input += hash_bytes(hash);
    }
    out.seed = infra::Hasher::blake2_256(input);
    return out;
}

} // namespace kitties::runtime
