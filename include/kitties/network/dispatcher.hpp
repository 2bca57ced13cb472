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
 * @file dispatcher.hpp
 * @brief JSON call dispatcher in front of the kitties runtime.
 *
 * @details
 * The `Dispatcher` is the application-layer gateway of `kittyd`. It decodes a
 * JSON request, looks the call name up in its dispatch table, runs the handler
 * against the runtime and serializes the outcome.
 *
 * **Calls:**
 * | call            | kind      | arguments                          |
 * |-----------------|-----------|------------------------------------|
 * | `create_kitty`  | extrinsic | `origin`                           |
 * | `seal_block`    | block     | none                               |
 * | `count_kitties` | query     | none                               |
 * | `get_kitty`     | query     | `dna` (32 hex digits)              |
 * | `kitties_owned` | query     | `owner`                            |
 *
 * `origin` is `{"signed": "<account>"}`, `"root"` or `"none"`. A missing
 * origin is treated as `"none"`.
 */

#pragma once

#include "kitties/runtime/chain.hpp"
#include "kitties/runtime/event_log.hpp"
#include "kitties/runtime/pallet.hpp"

#include <cJSON.h>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kitties::network {

/**
 * @struct Reply
 * @brief Status of a handled call. Payload fields go straight into the response.
 */
struct Reply {
    bool success = false;
    std::string error;   ///< Stable error name when `success` is false.
    std::string message; ///< Human-readable detail, optional.

    static Reply ok(std::string message = "") { return Reply{true, "", std::move(message)}; }
    static Reply fail(std::string error, std::string message)
    {
        return Reply{false, std::move(error), std::move(message)};
    }
};

/**
 * @class Dispatcher
 * @brief Routes decoded requests to call handlers.
 */
class Dispatcher {
  public:
    /// @brief Handler signature: reads `request`, adds payload fields to `response`.
    using CallHandler = std::function<Reply(const cJSON* request, cJSON* response)>;

    /**
     * @param pallet The kitties module. Must outlive the dispatcher.
     * @param chain Block context driven by the dispatcher.
     * @param events Event sink wired into `pallet`.
     */
    Dispatcher(runtime::Pallet& pallet, runtime::Chain& chain, runtime::EventLog& events);

    /**
     * @brief Processes one raw request.
     *
     * @return A compact JSON response:
     * - **Success:** `{"status":"ok", ...payload}`
     * - **Error:** `{"status":"error","error":"<Name>","message":"<detail>"}`
     *
     * Malformed JSON, unknown calls and bad arguments are errors too; this
     * function never throws.
     *
     * @code
     * dispatcher.process(R"({"call":"create_kitty","origin":{"signed":"alice"}})");
     * // {"status":"ok","dna":"4f0c...","gender":"Female","events":[...]}
     * @endcode
     */
    std::string process(const std::string& raw_json);

    /// @brief Registered call names, sorted.
    std::vector<std::string> calls() const;

  private:
    runtime::Pallet& pallet_;
    runtime::Chain& chain_;
    runtime::EventLog& events_;
    std::unordered_map<std::string, CallHandler> table_;

    Reply create_kitty(const cJSON* request, cJSON* response);
    Reply seal_block(const cJSON* request, cJSON* response);
    Reply count_kitties(const cJSON* request, cJSON* response);
    Reply get_kitty(const cJSON* request, cJSON* response);
    Reply kitties_owned(const cJSON* request, cJSON* response);

    /**
     * @brief Decodes the `origin` member of a request.
     * @return false If `origin` is present but not one of the accepted shapes.
     */
    static bool parse_origin(const cJSON* request, runtime::Origin& out);
};

} // namespace kitties::network
