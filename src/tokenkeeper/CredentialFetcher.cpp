//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CredentialFetcher.cpp
// Purpose: Debounced, backoff-throttled credential refresh routine
//==========================================================================================================

#include "tokenkeeper/CredentialFetcher.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "logging/Logger.h"

using namespace std::chrono;

namespace tokenkeeper {

CredentialFetcher::CredentialFetcher(CredentialState& state,
                                     IServiceClient& client,
                                     TokenIssueFunction issuer,
                                     FetchPolicy policy,
                                     std::shared_ptr<IClock> clock)
    : state(state),
      client(client),
      issuer(std::move(issuer)),
      policy(policy),
      clock(std::move(clock)) {
    if (!this->issuer) {
        throw std::invalid_argument("CredentialFetcher: issuer must not be empty");
    }
    if (!this->clock) {
        throw std::invalid_argument("CredentialFetcher: clock must not be null");
    }
}

milliseconds CredentialFetcher::NextBackoff(milliseconds current, milliseconds minBackoff, milliseconds maxBackoff) {
    milliseconds next = current * 2;
    if (next < minBackoff) {
        next = minBackoff;
    }
    if (next >= maxBackoff) {
        next = maxBackoff;
    }
    return next;
}

std::optional<errors::FetchError> CredentialFetcher::Fetch() {
    FUNC_SCOPE();
    const auto now = clock->SteadyNow();
    milliseconds sleepBeforeCall{0};
    {
        std::lock_guard<std::mutex> lk(state.mtx);
        if (state.lastFetchAt && now - *state.lastFetchAt < policy.minFetchInterval) {
            LOG_DEBUG("CredentialFetcher: fetch skipped, last attempt {}ms ago",
                      duration_cast<milliseconds>(now - *state.lastFetchAt).count());
            return errors::makeHighFrequencyError();
        }
        state.lastFetchAt = now;
        if (state.consecutiveFailures > 0u) {
            sleepBeforeCall = state.currentBackoff;
        }
    }

    if (sleepBeforeCall.count() > 0) {
        LOG_DEBUG("CredentialFetcher: backing off {}ms before issuer call", sleepBeforeCall.count());
        clock->SleepFor(sleepBeforeCall);
    }

    IssueResult issued;
    issuerCalls.fetch_add(1ul);
    try {
        issued = issuer();
    } catch (const std::exception& e) {
        issued = IssueResult::Failure(std::string("credential issuer threw: ") + e.what());
    }

    if (!issued.ok()) {
        unsigned int failures = 0u;
        milliseconds backoff{0};
        {
            std::lock_guard<std::mutex> lk(state.mtx);
            failures = ++state.consecutiveFailures;
            state.currentBackoff = NextBackoff(state.currentBackoff, policy.backoffMin, policy.backoffMax);
            backoff = state.currentBackoff;
        }
        LOG_WARN("CredentialFetcher: fetch credential error (consecutive failures={}, next backoff={}ms): {}",
                 failures, backoff.count(), *issued.error);
        return errors::makeCredentialFetchError(*issued.error);
    }

    const Credential& cred = issued.credential;
    {
        std::lock_guard<std::mutex> lk(state.mtx);
        state.consecutiveFailures = 0u;
        state.currentBackoff = milliseconds{0};
        if (cred.expiresAt > state.expiresAt) {
            state.expiresAt = cred.expiresAt;
        }
    }

    try {
        client.ResetAccessKeyToken(cred.accessKeyId, cred.accessKeySecret, cred.securityToken);
    } catch (const std::exception& e) {
        LOG_WARN("CredentialFetcher: underlying client rejected credential update: {}", e.what());
    }
    LOG_INFO("CredentialFetcher: fetch credential success, id: {}", cred.accessKeyId);
    return std::nullopt;
}

} // namespace tokenkeeper
