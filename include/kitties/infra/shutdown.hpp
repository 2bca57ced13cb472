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
 * @file shutdown.hpp
 * @brief Process-wide shutdown flag driven by SIGINT/SIGTERM.
 *
 * @details
 * The handlers are installed without `SA_RESTART`, so a read blocked on stdin
 * returns with `EINTR` when a signal arrives and the request loop can observe
 * the flag instead of waiting for the next line.
 */

#pragma once

#include <csignal>

namespace kitties::infra {

class Shutdown {
  public:
    /**
     * @brief Installs the SIGINT and SIGTERM handlers.
     * @throws std::runtime_error If `sigaction` fails.
     */
    static void install();

    /// @brief True once a termination signal has been received.
    static bool requested() { return flag_ != 0; }

  private:
    static void handle(int signum);

    static volatile std::sig_atomic_t flag_;
};

} // namespace kitties::infra
