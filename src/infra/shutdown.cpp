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

#include "kitties/infra/shutdown.hpp"

#include <signal.h>
#include <stdexcept>

namespace kitties::infra {

volatile std::sig_atomic_t Shutdown::flag_ = 0;

void Shutdown::handle(int)
{
    flag_ = 1;
}

void Shutdown::install()
{
    struct sigaction action {};
    action.sa_handler = &Shutdown::handle;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART: interrupt blocking reads

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        throw std::runtime_error("Shutdown: Failed to install signal handlers");
    }
}

} // namespace kitties::infra
