//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialFetcher.hpp
// Purpose: Debounced, backoff-throttled credential refresh routine
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "tokenkeeper/Clock.h"
#include "tokenkeeper/Credential.h"
#include "tokenkeeper/CredentialState.h"
#include "tokenkeeper/ServiceClient.h"
#include "tokenkeeper/errors/Errors.h"

namespace tokenkeeper {

//==========================================================================================================
// FetchPolicy
// Purpose: Timing limits applied to refresh attempts.
// Fields:
//   minFetchInterval: Debounce window; attempts closer together than this are rejected as HighFrequency.
//   backoffMin/backoffMax: Clamp range of the delay inserted before an attempt that follows failures.
//==========================================================================================================
struct FetchPolicy {
    std::chrono::milliseconds minFetchInterval{1000};
    std::chrono::milliseconds backoffMin{1000};
    std::chrono::milliseconds backoffMax{60000};
};

//==========================================================================================================
// CredentialFetcher
// Purpose: Performs one refresh attempt against the credential issuer and installs the result into the
//          underlying client. Safe to call from any number of threads; the debounce check serializes
//          effective attempts.
//==========================================================================================================
class CredentialFetcher {
public:
    CredentialFetcher(CredentialState& state,
                      IServiceClient& client,
                      TokenIssueFunction issuer,
                      FetchPolicy policy,
                      std::shared_ptr<IClock> clock);

    //==========================================================================================================
    // Fetch
    // Purpose: Runs one refresh attempt.
    // Returns:
    //   std::nullopt on success (credential pushed into the client). Otherwise a FetchError with category
    //   HighFrequency (debounced, nothing attempted) or CredentialFetch (issuer failed).
    //==========================================================================================================
    std::optional<errors::FetchError> Fetch();

    //==========================================================================================================
    // NextBackoff
    // Purpose: Backoff that follows `current` after another failure: current*2 clamped to [minBackoff, maxBackoff].
    //==========================================================================================================
    static std::chrono::milliseconds NextBackoff(std::chrono::milliseconds current,
                                                 std::chrono::milliseconds minBackoff,
                                                 std::chrono::milliseconds maxBackoff);

    // Number of times the issuer has been invoked.
    unsigned long IssuerCalls() const { return issuerCalls.load(); }

private:
    CredentialState& state;
    IServiceClient& client;
    TokenIssueFunction issuer;
    FetchPolicy policy;
    std::shared_ptr<IClock> clock;
    std::atomic<unsigned long> issuerCalls{0ul};
};

} // namespace tokenkeeper
