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

#include "kitties/runtime/event_log.hpp"

#include "kitties/infra/logger.hpp"

#include <utility>

namespace kitties::runtime {

void EventLog::deposit(const Event& event)
{
    infra::Logger::log(infra::LogLevel::INFO, "Event: Created { kitty: " + dna_hex(event.kitty) +
                                                  ", owner: " + event.owner + " }");
    events_.push_back(event);
}

std::vector<Event> EventLog::drain()
{
    std::vector<Event> out = std::move(events_);
    events_.clear();
    return out;
}

} // namespace kitties::runtime
