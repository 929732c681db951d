//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RefreshScheduler.hpp
// Purpose: Background task that refreshes the credential ahead of its expiry
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>

#include "tokenkeeper/Clock.h"
#include "tokenkeeper/CredentialFetcher.hpp"
#include "tokenkeeper/CredentialState.h"

namespace tokenkeeper {

//==========================================================================================================
// RefreshScheduler
// Purpose: Owns one std::jthread that sleeps an interval derived from the time left before expiry, then
//          runs CredentialFetcher::Fetch(). Fetch failures never end the loop; only a stop request (the
//          host's shutdown token, Stop(), or destruction) or the closed flag does.
//==========================================================================================================
class RefreshScheduler {
public:
    //==========================================================================================================
    // Starts the background thread.
    // Args:
    //   state: Credential state read for the current expiry.
    //   fetcher: Refresh routine invoked after each elapsed interval.
    //   clock: Time source for the expiry computation and the cancellable wait.
    //   shutdown: Host shutdown token; a stop request on it stops the scheduler.
    //==========================================================================================================
    RefreshScheduler(const CredentialState& state,
                     CredentialFetcher& fetcher,
                     std::shared_ptr<IClock> clock,
                     std::stop_token shutdown = {});
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    //==========================================================================================================
    // Sets the closed flag; the loop exits after its current wait/fetch cycle completes.
    //==========================================================================================================
    void Close();

    //==========================================================================================================
    // Requests stop and joins the background thread. Idempotent.
    //==========================================================================================================
    void Stop();

    bool IsRunning() const { return running.load(); }

    // Number of fetch attempts made by the loop.
    unsigned long FetchAttempts() const { return fetchAttempts.load(); }

    //==========================================================================================================
    // ComputeSleepInterval
    // Purpose: Maps time-to-expiry onto the wait before the next refresh:
    //   < 1 minute  -> fixed 30 seconds
    //   < 10 minutes -> 70% of the remaining time
    //   < 1 hour    -> 60% of the remaining time
    //   otherwise   -> 50% of the remaining time
    //==========================================================================================================
    static std::chrono::milliseconds ComputeSleepInterval(std::chrono::milliseconds timeToExpiry);

private:
    void Run(std::stop_token st);

    const CredentialState& state;
    CredentialFetcher& fetcher;
    std::shared_ptr<IClock> clock;

    std::atomic<bool> closed{false};
    std::atomic<bool> running{false};
    std::atomic<unsigned long> fetchAttempts{0ul};

    std::jthread worker;
    std::optional<std::stop_callback<std::function<void()>>> shutdownLink;
};

} // namespace tokenkeeper
