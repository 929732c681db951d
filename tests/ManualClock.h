//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/ManualClock.h
// Purpose: Test clock whose time only moves when a test advances it or releases a pending wait
//==========================================================================================================
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "tokenkeeper/Clock.h"

namespace testutil {

//==========================================================================================================
// ManualClock
// Purpose: SleepFor() advances time instantly and records the duration. WaitFor() records the requested
//          interval and blocks until the test calls Release() (time then advances by that interval) or stop
//          is requested on the token. Wall and monotonic readings move together except through StepWallClock().
//==========================================================================================================
class ManualClock : public tokenkeeper::IClock {
public:
    // Starts well past the epoch so "never fetched" state is always outside any debounce window.
    ManualClock()
        : now(std::chrono::system_clock::time_point{} + std::chrono::hours(24 * 365 * 50)),
          steady(SteadyTimePoint{} + std::chrono::hours(24 * 365)) {}

    TimePoint Now() const override {
        std::lock_guard<std::mutex> lk(mtx);
        return now;
    }

    SteadyTimePoint SteadyNow() const override {
        std::lock_guard<std::mutex> lk(mtx);
        return steady;
    }

    void Advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lk(mtx);
        now += d;
        steady += d;
    }

    // Moves only the wall clock, like an NTP or manual time step.
    void StepWallClock(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lk(mtx);
        now += d;
    }

    void SleepFor(std::chrono::milliseconds d) override {
        std::lock_guard<std::mutex> lk(mtx);
        sleeps.push_back(d);
        now += d;
        steady += d;
    }

    bool WaitFor(std::chrono::milliseconds d, std::stop_token st) override {
        std::unique_lock<std::mutex> lk(mtx);
        waits.push_back(d);
        cv.notify_all();
        if (!cv.wait(lk, st, [this]() { return grants > 0u; })) {
            return false;
        }
        --grants;
        now += d;
        steady += d;
        return true;
    }

    // Lets n pending or future WaitFor() calls complete as if their interval elapsed.
    void Release(unsigned int n = 1u) {
        std::lock_guard<std::mutex> lk(mtx);
        grants += n;
        cv.notify_all();
    }

    std::vector<std::chrono::milliseconds> Sleeps() const {
        std::lock_guard<std::mutex> lk(mtx);
        return sleeps;
    }

    std::vector<std::chrono::milliseconds> Waits() const {
        std::lock_guard<std::mutex> lk(mtx);
        return waits;
    }

    // Blocks (real time) until at least count WaitFor() calls have been made.
    bool WaitForWaiters(std::size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lk(mtx);
        return cv.wait_for(lk, timeout, [&]() { return waits.size() >= count; });
    }

private:
    mutable std::mutex mtx;
    std::condition_variable_any cv;
    TimePoint now;
    SteadyTimePoint steady;
    unsigned int grants{0u};
    std::vector<std::chrono::milliseconds> sleeps;
    std::vector<std::chrono::milliseconds> waits;
};

// Polls pred in real time until it holds or timeout passes.
inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

} // namespace testutil
