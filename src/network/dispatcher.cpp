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
 * @file dispatcher.cpp
 * @brief Implementation of the call processing pipeline.
 *
 * @details
 * Request lifecycle:
 * 1. **Ingest**: Parse the raw JSON request.
 * 2. **Route**: Look the `call` name up in the dispatch table.
 * 3. **Execute**: Run the handler against the runtime.
 * 4. **Respond**: Serialize status, error name and payload.
 */

#include "kitties/network/dispatcher.hpp"

#include "kitties/infra/logger.hpp"
#include "kitties/infra/string.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>

namespace kitties::network {

namespace {

/// @brief Sent when a response document cannot be serialized.
const char kSerializationFailure[] =
    R"({"status":"error","error":"InternalError","message":"Response serialization failed"})";

/// @brief Serializes and releases `doc`.
std::string print_and_free(cJSON* doc)
{
    char* raw = cJSON_PrintUnformatted(doc);
    cJSON_Delete(doc);
    if (!raw) {
        infra::Logger::log(infra::LogLevel::ERROR, "Dispatch: Response serialization failed");
        return kSerializationFailure;
    }
    std::string out(raw);
    free(raw);
    return out;
}

std::string error_response(const std::string& error, const std::string& message)
{
    cJSON* resp = cJSON_CreateObject();
    cJSON_AddStringToObject(resp, "status", "error");
    cJSON_AddStringToObject(resp, "error", error.c_str());
    cJSON_AddStringToObject(resp, "message", message.c_str());
    return print_and_free(resp);
}

/// @brief Closes the open extrinsic on every exit path of a call.
class ExtrinsicScope {
  public:
    explicit ExtrinsicScope(runtime::Chain& chain) : chain_(chain) { chain_.begin_extrinsic(); }
    ~ExtrinsicScope() { chain_.end_extrinsic(); }
    ExtrinsicScope(const ExtrinsicScope&) = delete;
    ExtrinsicScope& operator=(const ExtrinsicScope&) = delete;

  private:
    runtime::Chain& chain_;
};

cJSON* kitty_to_json(const runtime::Kitty& kitty)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "dna", runtime::dna_hex(kitty.dna).c_str());
    if (kitty.price)
        cJSON_AddStringToObject(obj, "price", std::to_string(*kitty.price).c_str());
    else
        cJSON_AddNullToObject(obj, "price");
    cJSON_AddStringToObject(obj, "gender", runtime::gender_name(kitty.gender));
    cJSON_AddStringToObject(obj, "owner", kitty.owner.c_str());
    return obj;
}

cJSON* event_to_json(const runtime::Event& event)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "event", "Created");
    cJSON_AddStringToObject(obj, "kitty", runtime::dna_hex(event.kitty).c_str());
    cJSON_AddStringToObject(obj, "owner", event.owner.c_str());
    return obj;
}

} // namespace

Dispatcher::Dispatcher(runtime::Pallet& pallet, runtime::Chain& chain, runtime::EventLog& events)
    : pallet_(pallet), chain_(chain), events_(events)
{
    table_["create_kitty"] = [this](const cJSON* req, cJSON* resp) {
        return create_kitty(req, resp);
    };
    table_["seal_block"] = [this](const cJSON* req, cJSON* resp) { return seal_block(req, resp); };
    table_["count_kitties"] = [this](const cJSON* req, cJSON* resp) {
        return count_kitties(req, resp);
    };
    table_["get_kitty"] = [this](const cJSON* req, cJSON* resp) { return get_kitty(req, resp); };
    table_["kitties_owned"] = [this](const cJSON* req, cJSON* resp) {
        return kitties_owned(req, resp);
    };
}

std::vector<std::string> Dispatcher::calls() const
{
    std::vector<std::string> names;
    for (const auto& [name, handler] : table_)
        names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

std::string Dispatcher::process(const std::string& raw_json)
{
    if (raw_json.empty()) {
        return error_response("BadRequest", "Empty request payload");
    }

    // 1. INGEST PHASE
    cJSON* req = cJSON_Parse(raw_json.c_str());
    if (!req) {
        return error_response("BadRequest", "Invalid JSON syntax");
    }
    if (!cJSON_IsObject(req)) {
        cJSON_Delete(req);
        return error_response("BadRequest", "Request must be a JSON object");
    }

    // 2. ROUTING PHASE
    cJSON* call_node = cJSON_GetObjectItem(req, "call");
    std::string call = cJSON_IsString(call_node) ? call_node->valuestring : "";
    auto it = table_.find(call);
    if (it == table_.end()) {
        cJSON_Delete(req);
        infra::Logger::log(infra::LogLevel::WARN, "Dispatch: Unknown call '" + call + "'");
        return error_response("UnknownCall", "Unknown call: " + call);
    }

    // 3. EXECUTION PHASE
    cJSON* resp_root = cJSON_CreateObject();
    Reply reply;
    try {
        reply = it->second(req, resp_root);
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Dispatch: '" + call + "' aborted: " + std::string(e.what()));
        cJSON_Delete(resp_root);
        cJSON_Delete(req);
        return error_response("InternalError", e.what());
    }
    infra::Logger::log(infra::LogLevel::TRACE,
                       "Dispatch: " + call + " -> " + (reply.success ? "ok" : reply.error));

    // 4. RESPONSE CONSTRUCTION PHASE
    cJSON_AddStringToObject(resp_root, "status", reply.success ? "ok" : "error");
    if (!reply.success) {
        cJSON_AddStringToObject(resp_root, "error", reply.error.c_str());
    }
    if (!reply.message.empty()) {
        cJSON_AddStringToObject(resp_root, "message", reply.message.c_str());
    }

    cJSON_Delete(req);
    return print_and_free(resp_root);
}

bool Dispatcher::parse_origin(const cJSON* request, runtime::Origin& out)
{
    const cJSON* origin = cJSON_GetObjectItem(request, "origin");
    if (!origin || cJSON_IsNull(origin)) {
        out = runtime::Origin::none();
        return true;
    }
    if (cJSON_IsString(origin)) {
        std::string kind = origin->valuestring;
        if (kind == "none") {
            out = runtime::Origin::none();
            return true;
        }
        if (kind == "root") {
            out = runtime::Origin::root();
            return true;
        }
        return false;
    }
    const cJSON* signer = cJSON_GetObjectItem(origin, "signed");
    if (cJSON_IsObject(origin) && cJSON_IsString(signer)) {
        out = runtime::Origin::signed_by(signer->valuestring);
        return true;
    }
    return false;
}

Reply Dispatcher::create_kitty(const cJSON* request, cJSON* response)
{
    runtime::Origin origin;
    if (!parse_origin(request, origin)) {
        return Reply::fail("BadRequest", "Malformed 'origin'");
    }

    runtime::DispatchResult result;
    {
        ExtrinsicScope scope(chain_);
        result = pallet_.create_kitty(origin);
    }

    cJSON* events = cJSON_AddArrayToObject(response, "events");
    for (const auto& event : events_.drain()) {
        cJSON_AddItemToArray(events, event_to_json(event));
    }

    if (!result.ok()) {
        return Reply::fail(runtime::error_name(result.error), "create_kitty rejected");
    }

    cJSON_AddStringToObject(response, "dna", runtime::dna_hex(result.dna).c_str());
    auto kitty = pallet_.registry().kitty(result.dna);
    if (kitty) {
        cJSON_AddStringToObject(response, "gender", runtime::gender_name(kitty->gender));
    }
    return Reply::ok();
}

Reply Dispatcher::seal_block(const cJSON*, cJSON* response)
{
    uint64_t sealed = chain_.block_number();
    auto hash = chain_.seal_block();
    if (!hash) {
        return Reply::fail(runtime::error_name(runtime::Error::StorageFailure),
                           "Block #" + std::to_string(sealed) + " head could not be saved");
    }
    cJSON_AddNumberToObject(response, "block", static_cast<double>(sealed));
    std::string hash_bytes(reinterpret_cast<const char*>(hash->data()), hash->size());
    cJSON_AddStringToObject(response, "hash", infra::String::to_hex(hash_bytes).c_str());
    return Reply::ok();
}

Reply Dispatcher::count_kitties(const cJSON*, cJSON* response)
{
    // Decimal string so counts above 2^53 survive JSON clients.
    uint64_t count = pallet_.registry().count_for_kitties();
    cJSON_AddStringToObject(response, "count", std::to_string(count).c_str());
    return Reply::ok();
}

Reply Dispatcher::get_kitty(const cJSON* request, cJSON* response)
{
    const cJSON* dna_node = cJSON_GetObjectItem(request, "dna");
    runtime::Dna dna{};
    if (!cJSON_IsString(dna_node) || !runtime::parse_dna(dna_node->valuestring, dna)) {
        return Reply::fail("BadRequest", "'dna' must be 32 hex digits");
    }

    auto kitty = pallet_.registry().kitty(dna);
    if (!kitty) {
        return Reply::fail("NotFound", "No kitty with DNA " + runtime::dna_hex(dna));
    }
    cJSON_AddItemToObject(response, "kitty", kitty_to_json(*kitty));
    return Reply::ok();
}

Reply Dispatcher::kitties_owned(const cJSON* request, cJSON* response)
{
    const cJSON* owner = cJSON_GetObjectItem(request, "owner");
    if (!cJSON_IsString(owner)) {
        return Reply::fail("BadRequest", "Missing argument: 'owner'");
    }

    cJSON* arr = cJSON_AddArrayToObject(response, "kitties");
    for (const auto& dna : pallet_.registry().kitties_owned(owner->valuestring)) {
        cJSON_AddItemToArray(arr, cJSON_CreateString(runtime::dna_hex(dna).c_str()));
    }
    return Reply::ok();
}

} // namespace kitties::network
