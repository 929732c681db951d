//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Clock.cpp
// Purpose: System clock implementation with stop_token-aware waits
//==========================================================================================================

#include "tokenkeeper/Clock.h"

#include <condition_variable>
#include <mutex>
#include <thread>

namespace tokenkeeper {

IClock::TimePoint SystemClock::Now() const {
    return std::chrono::system_clock::now();
}

IClock::SteadyTimePoint SystemClock::SteadyNow() const {
    return std::chrono::steady_clock::now();
}

void SystemClock::SleepFor(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

bool SystemClock::WaitFor(std::chrono::milliseconds duration, std::stop_token stopToken) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(m);
    // Only a stop request ends the wait early; the predicate has no other wake-up condition.
    (void)cv.wait_for(lk, stopToken, duration, [] { return false; });
    return !stopToken.stop_requested();
}

std::shared_ptr<IClock> SystemClock::Instance() {
    static std::shared_ptr<IClock> instance = std::make_shared<SystemClock>();
    return instance;
}

} // namespace tokenkeeper
