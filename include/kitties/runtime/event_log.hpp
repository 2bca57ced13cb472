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
 * @file event_log.hpp
 * @brief In-memory `EventSink` that records and logs deposited events.
 */

#pragma once

#include "kitties/runtime/environment.hpp"

#include <vector>

namespace kitties::runtime {

class EventLog : public EventSink {
  public:
    void deposit(const Event& event) override;

    /// @brief Events deposited since the last `drain()`, oldest first.
    const std::vector<Event>& events() const { return events_; }

    /// @brief Hands over the pending events and clears the log.
    std::vector<Event> drain();

  private:
    std::vector<Event> events_;
};

} // namespace kitties::runtime
