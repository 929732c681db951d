//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialState.h
// Purpose: Shared record of the current credential's expiry and refresh history
//==========================================================================================================

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace tokenkeeper {

//==========================================================================================================
// CredentialSnapshot
// Purpose: Point-in-time copy of CredentialState for diagnostics and tests.
//==========================================================================================================
struct CredentialSnapshot {
    std::chrono::system_clock::time_point expiresAt{};
    std::optional<std::chrono::steady_clock::time_point> lastFetchAt;
    unsigned int consecutiveFailures{0u};
    std::chrono::milliseconds currentBackoff{0};
};

//==========================================================================================================
// CredentialState
// Purpose: Single owned instance shared by reference between CredentialFetcher (sole writer) and
//          RefreshScheduler (reader). All fields are guarded by mtx; hold it only to read or update fields,
//          never across a sleep or a call into a collaborator.
//==========================================================================================================
struct CredentialState {
    explicit CredentialState(std::chrono::system_clock::time_point initialExpiresAt = {})
        : expiresAt(initialExpiresAt) {}

    CredentialState(const CredentialState&) = delete;
    CredentialState& operator=(const CredentialState&) = delete;

    CredentialSnapshot Snapshot() const {
        std::lock_guard<std::mutex> lk(mtx);
        CredentialSnapshot s;
        s.expiresAt = expiresAt;
        s.lastFetchAt = lastFetchAt;
        s.consecutiveFailures = consecutiveFailures;
        s.currentBackoff = currentBackoff;
        return s;
    }

    std::chrono::system_clock::time_point ExpiresAt() const {
        std::lock_guard<std::mutex> lk(mtx);
        return expiresAt;
    }

    mutable std::mutex mtx;
    std::chrono::system_clock::time_point expiresAt{};
    // Monotonic; empty until the first attempt.
    std::optional<std::chrono::steady_clock::time_point> lastFetchAt;
    unsigned int consecutiveFailures{0u};
    std::chrono::milliseconds currentBackoff{0};
};

} // namespace tokenkeeper
