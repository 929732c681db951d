//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RefreshScheduler.cpp
// Purpose: Background task that refreshes the credential ahead of its expiry
//==========================================================================================================

#include "tokenkeeper/RefreshScheduler.hpp"

#include <stdexcept>
#include <utility>

#include "logging/Logger.h"

using namespace std::chrono;

namespace tokenkeeper {

RefreshScheduler::RefreshScheduler(const CredentialState& state,
                                   CredentialFetcher& fetcher,
                                   std::shared_ptr<IClock> clock,
                                   std::stop_token shutdown)
    : state(state),
      fetcher(fetcher),
      clock(std::move(clock)) {
    if (!this->clock) {
        throw std::invalid_argument("RefreshScheduler: clock must not be null");
    }
    running.store(true);
    worker = std::jthread([this](std::stop_token st) { Run(st); });
    if (shutdown.stop_possible()) {
        // Runs immediately when the host already requested shutdown.
        shutdownLink.emplace(shutdown, std::function<void()>([this]() { worker.request_stop(); }));
    }
}

RefreshScheduler::~RefreshScheduler() {
    Stop();
}

void RefreshScheduler::Close() {
    closed.store(true);
}

void RefreshScheduler::Stop() {
    FUNC_SCOPE();
    shutdownLink.reset();
    if (worker.joinable()) {
        worker.request_stop();
        worker.join();
    }
}

milliseconds RefreshScheduler::ComputeSleepInterval(milliseconds timeToExpiry) {
    if (timeToExpiry < minutes(1)) {
        return seconds(30);
    }
    if (timeToExpiry < minutes(10)) {
        return timeToExpiry / 10 * 7;
    }
    if (timeToExpiry < hours(1)) {
        return timeToExpiry / 10 * 6;
    }
    return timeToExpiry / 10 * 5;
}

void RefreshScheduler::Run(std::stop_token st) {
    while (true) {
        const auto timeToExpiry = duration_cast<milliseconds>(state.ExpiresAt() - clock->Now());
        const auto interval = ComputeSleepInterval(timeToExpiry);
        LOG_DEBUG("RefreshScheduler: next fetch sleep interval: {}ms", interval.count());

        if (!clock->WaitFor(interval, st)) {
            LOG_INFO("RefreshScheduler: receive shutdown signal, exit refresh loop");
            break;
        }

        auto err = fetcher.Fetch();
        fetchAttempts.fetch_add(1ul);
        if (err.has_value()) {
            LOG_INFO("RefreshScheduler: fetch credential done, error: {}: {}",
                     errors::categoryName(err->category), err->message);
        } else {
            LOG_DEBUG("RefreshScheduler: fetch credential done");
        }

        if (closed.load()) {
            LOG_INFO("RefreshScheduler: close flag is set, exit refresh loop");
            break;
        }
    }
    running.store(false);
}

} // namespace tokenkeeper
