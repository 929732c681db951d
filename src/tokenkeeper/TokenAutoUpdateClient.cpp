//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenAutoUpdateClient.cpp
// Purpose: Log service client decorator that keeps the credential fresh and retries on credential rejection
//==========================================================================================================

#include "tokenkeeper/TokenAutoUpdateClient.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "tokenkeeper/ConfigString.h"

using namespace std::chrono;

namespace tokenkeeper {

static FetchPolicy makeFetchPolicy(const TokenAutoUpdateClient::Options& opts) {
    FetchPolicy p;
    p.minFetchInterval = milliseconds(opts.minFetchIntervalMs);
    unsigned int lo = opts.backoffMinMs;
    unsigned int hi = opts.backoffMaxMs;
    if (lo > hi) {
        LOG_WARN("TokenAutoUpdateClient: backoffMinMs ({}) > backoffMaxMs ({}), swapping", lo, hi);
        std::swap(lo, hi);
    }
    p.backoffMin = milliseconds(lo);
    p.backoffMax = milliseconds(hi);
    return p;
}

static ServiceClientPtr requireInner(ServiceClientPtr inner) {
    if (!inner) {
        throw std::invalid_argument("TokenAutoUpdateClient: inner client must not be null");
    }
    return inner;
}

static std::shared_ptr<IClock> clockOrDefault(std::shared_ptr<IClock> clock) {
    return clock ? std::move(clock) : SystemClock::Instance();
}

TokenAutoUpdateClient::TokenAutoUpdateClient(ServiceClientPtr inner,
                                             TokenIssueFunction issuer,
                                             const Options& opts,
                                             std::stop_token shutdown,
                                             std::shared_ptr<IClock> clock)
    : inner(requireInner(std::move(inner))),
      options(opts),
      clock(clockOrDefault(std::move(clock))),
      state(opts.initialExpiresAt),
      fetcher(state, *this->inner, std::move(issuer), makeFetchPolicy(opts), this->clock),
      invoker([this]() { return fetcher.Fetch(); }, opts.maxTryTimes) {
    FUNC_SCOPE();
    if (opts.initialExpiresAt <= this->clock->Now()) {
        // No usable credential known: refresh now instead of waiting out the first scheduler interval.
        auto err = fetcher.Fetch();
        if (err.has_value()) {
            LOG_WARN("TokenAutoUpdateClient: first credential fetch failed: {}", err->message);
        }
    }
    scheduler = std::make_unique<RefreshScheduler>(state, fetcher, this->clock, std::move(shutdown));
}

TokenAutoUpdateClient::~TokenAutoUpdateClient() {
    FUNC_SCOPE();
    if (scheduler) {
        scheduler->Stop();
    }
}

void TokenAutoUpdateClient::Close() {
    scheduler->Close();
}

std::optional<errors::FetchError> TokenAutoUpdateClient::ForceRefresh() {
    return fetcher.Fetch();
}

CredentialSnapshot TokenAutoUpdateClient::Snapshot() const {
    return state.Snapshot();
}

bool TokenAutoUpdateClient::IsSchedulerRunning() const {
    return scheduler && scheduler->IsRunning();
}

////////////////////////////////////////// Passthrough //////////////////////////////////////////

void TokenAutoUpdateClient::ResetAccessKeyToken(const std::string& accessKeyId,
                                                const std::string& accessKeySecret,
                                                const std::string& securityToken) {
    inner->ResetAccessKeyToken(accessKeyId, accessKeySecret, securityToken);
}

void TokenAutoUpdateClient::SetUserAgent(const std::string& userAgent) {
    inner->SetUserAgent(userAgent);
}

void TokenAutoUpdateClient::SetRetryTimeout(milliseconds timeout) {
    inner->SetRetryTimeout(timeout);
}

void TokenAutoUpdateClient::SetAuthVersion(AuthVersion version) {
    inner->SetAuthVersion(version);
}

void TokenAutoUpdateClient::SetRegion(const std::string& region) {
    inner->SetRegion(region);
}

////////////////////////////////////////// Projects //////////////////////////////////////////

Outcome<LogProject> TokenAutoUpdateClient::CreateProject(const std::string& name, const std::string& description) {
    return invoker.Invoke([&]() { return inner->CreateProject(name, description); });
}

Outcome<LogProject> TokenAutoUpdateClient::GetProject(const std::string& name) {
    return invoker.Invoke([&]() { return inner->GetProject(name); });
}

Outcome<LogProject> TokenAutoUpdateClient::UpdateProject(const std::string& name, const std::string& description) {
    return invoker.Invoke([&]() { return inner->UpdateProject(name, description); });
}

Outcome<std::vector<std::string>> TokenAutoUpdateClient::ListProject() {
    return invoker.Invoke([&]() { return inner->ListProject(); });
}

Outcome<bool> TokenAutoUpdateClient::CheckProjectExist(const std::string& name) {
    return invoker.Invoke([&]() { return inner->CheckProjectExist(name); });
}

Outcome<void> TokenAutoUpdateClient::DeleteProject(const std::string& name) {
    return invoker.Invoke([&]() { return inner->DeleteProject(name); });
}

////////////////////////////////////////// Log stores //////////////////////////////////////////

Outcome<void> TokenAutoUpdateClient::CreateLogStore(const std::string& project, const LogStore& logstore) {
    return invoker.Invoke([&]() { return inner->CreateLogStore(project, logstore); });
}

Outcome<LogStore> TokenAutoUpdateClient::GetLogStore(const std::string& project, const std::string& logstore) {
    return invoker.Invoke([&]() { return inner->GetLogStore(project, logstore); });
}

Outcome<std::vector<std::string>> TokenAutoUpdateClient::ListLogStore(const std::string& project) {
    return invoker.Invoke([&]() { return inner->ListLogStore(project); });
}

Outcome<void> TokenAutoUpdateClient::UpdateLogStore(const std::string& project, const LogStore& logstore) {
    return invoker.Invoke([&]() { return inner->UpdateLogStore(project, logstore); });
}

Outcome<bool> TokenAutoUpdateClient::CheckLogstoreExist(const std::string& project, const std::string& logstore) {
    return invoker.Invoke([&]() { return inner->CheckLogstoreExist(project, logstore); });
}

Outcome<void> TokenAutoUpdateClient::DeleteLogStore(const std::string& project, const std::string& logstore) {
    return invoker.Invoke([&]() { return inner->DeleteLogStore(project, logstore); });
}

////////////////////////////////////////// Machine groups //////////////////////////////////////////

Outcome<void> TokenAutoUpdateClient::CreateMachineGroup(const std::string& project, const MachineGroup& group) {
    return invoker.Invoke([&]() { return inner->CreateMachineGroup(project, group); });
}

Outcome<MachineGroup> TokenAutoUpdateClient::GetMachineGroup(const std::string& project, const std::string& name) {
    return invoker.Invoke([&]() { return inner->GetMachineGroup(project, name); });
}

Outcome<MachineGroupList> TokenAutoUpdateClient::ListMachineGroup(const std::string& project, int offset, int size) {
    return invoker.Invoke([&]() { return inner->ListMachineGroup(project, offset, size); });
}

Outcome<void> TokenAutoUpdateClient::DeleteMachineGroup(const std::string& project, const std::string& name) {
    return invoker.Invoke([&]() { return inner->DeleteMachineGroup(project, name); });
}

////////////////////////////////////////// Log ingestion //////////////////////////////////////////

Outcome<void> TokenAutoUpdateClient::PutLogs(const std::string& project, const std::string& logstore, const LogGroup& group) {
    return invoker.Invoke([&]() { return inner->PutLogs(project, logstore, group); });
}

//==========================================================================================================
// TokenAutoUpdateClientFactory
//==========================================================================================================
TokenAutoUpdateClient::Options TokenAutoUpdateClientFactory::ParseOptions(const std::string& config) {
    TokenAutoUpdateClient::Options opts;
    for (const auto& [key, val] : parseConfigString(config)) {
        if (key == "maxTryTimes") {
            (void)parseUnsignedValue(key, val, opts.maxTryTimes);
        }
        else if (key == "minFetchIntervalMs") {
            (void)parseUnsignedValue(key, val, opts.minFetchIntervalMs);
        }
        else if (key == "backoffMinMs") {
            (void)parseUnsignedValue(key, val, opts.backoffMinMs);
        }
        else if (key == "backoffMaxMs") {
            (void)parseUnsignedValue(key, val, opts.backoffMaxMs);
        }
        else {
            LOG_WARN("TokenAutoUpdateClientFactory: unknown config key '{}'", key);
        }
    }
    return opts;
}

void TokenAutoUpdateClientFactory::ApplyEnvOverrides(TokenAutoUpdateClient::Options& opts) {
    struct EnvKey { const char* name; unsigned int* target; };
    const EnvKey keys[] = {
        {"TOKENKEEPER_MAX_TRY_TIMES", &opts.maxTryTimes},
        {"TOKENKEEPER_MIN_FETCH_INTERVAL_MS", &opts.minFetchIntervalMs},
        {"TOKENKEEPER_BACKOFF_MIN_MS", &opts.backoffMinMs},
        {"TOKENKEEPER_BACKOFF_MAX_MS", &opts.backoffMaxMs},
    };
    for (const auto& k : keys) {
        const std::string v = GetEnvOrDefault(k.name, "");
        if (!v.empty()) {
            (void)parseUnsignedValue(k.name, v, *k.target);
        }
    }
}

std::unique_ptr<TokenAutoUpdateClient> TokenAutoUpdateClientFactory::CreateClient(ServiceClientPtr inner,
                                                                                  TokenIssueFunction issuer,
                                                                                  const std::string& config,
                                                                                  std::stop_token shutdown,
                                                                                  std::shared_ptr<IClock> clock) {
    FUNC_SCOPE();
    if (!inner) {
        throw std::invalid_argument("TokenAutoUpdateClientFactory: inner client must not be null");
    }
    if (!issuer) {
        throw std::invalid_argument("TokenAutoUpdateClientFactory: issuer must not be empty");
    }
    auto opts = ParseOptions(config);
    ApplyEnvOverrides(opts);

    IssueResult first;
    try {
        first = issuer();
    } catch (const std::exception& e) {
        first = IssueResult::Failure(std::string("credential issuer threw: ") + e.what());
    }
    if (!first.ok()) {
        LOG_ERROR("TokenAutoUpdateClientFactory: initial credential fetch failed: {}", *first.error);
        throw std::runtime_error(std::string("initial credential fetch failed: ") + *first.error);
    }
    inner->ResetAccessKeyToken(first.credential.accessKeyId, first.credential.accessKeySecret,
                               first.credential.securityToken);
    opts.initialExpiresAt = first.credential.expiresAt;
    LOG_INFO("TokenAutoUpdateClientFactory: initial credential installed, id: {}", first.credential.accessKeyId);

    return std::make_unique<TokenAutoUpdateClient>(std::move(inner), std::move(issuer), opts,
                                                   std::move(shutdown), std::move(clock));
}

} // namespace tokenkeeper
