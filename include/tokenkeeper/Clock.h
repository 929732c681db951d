//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Clock.h
// Purpose: Time source used by the refresh layer (current time, throttle sleeps, cancellable waits)
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <stop_token>

namespace tokenkeeper {

//==========================================================================================================
// IClock
// Purpose: Abstracts wall-clock reads and blocking waits so refresh timing can be driven deterministically.
//==========================================================================================================
class IClock {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using SteadyTimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    //==========================================================================================================
    // Returns the current wall-clock time.
    //==========================================================================================================
    virtual TimePoint Now() const = 0;

    //==========================================================================================================
    // Returns a monotonic reading for measuring elapsed time. Unaffected by wall-clock steps.
    //==========================================================================================================
    virtual SteadyTimePoint SteadyNow() const = 0;

    //==========================================================================================================
    // Blocks the calling thread for the given duration. Not cancellable.
    //==========================================================================================================
    virtual void SleepFor(std::chrono::milliseconds duration) = 0;

    //==========================================================================================================
    // Waits until the duration elapses or stop is requested on the token, whichever comes first.
    // Returns:
    //   true when the full duration elapsed; false when stop was requested.
    //==========================================================================================================
    virtual bool WaitFor(std::chrono::milliseconds duration, std::stop_token stopToken) = 0;
};

//==========================================================================================================
// SystemClock
// Purpose: IClock backed by std::chrono::system_clock/steady_clock and std::condition_variable_any.
//==========================================================================================================
class SystemClock final : public IClock {
public:
    TimePoint Now() const override;
    SteadyTimePoint SteadyNow() const override;
    void SleepFor(std::chrono::milliseconds duration) override;
    bool WaitFor(std::chrono::milliseconds duration, std::stop_token stopToken) override;

    // Shared process-wide instance.
    static std::shared_ptr<IClock> Instance();
};

} // namespace tokenkeeper
