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

#include "kitties/storage/kv_store.hpp"

namespace kitties::storage {

void WriteBatch::put(std::string key, std::string value)
{
    writes_.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string> MemoryStore::get(const std::string& key) const
{
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

bool MemoryStore::contains(const std::string& key) const
{
    return entries_.find(key) != entries_.end();
}

bool MemoryStore::commit(const WriteBatch& batch)
{
    for (const auto& [key, value] : batch.writes()) {
        entries_[key] = value;
    }
    return true;
}

} // namespace kitties::storage
