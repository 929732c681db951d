//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenAutoUpdateClient.hpp
// Purpose: Log service client decorator that keeps the credential fresh and retries on credential rejection
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "tokenkeeper/Clock.h"
#include "tokenkeeper/Credential.h"
#include "tokenkeeper/CredentialFetcher.hpp"
#include "tokenkeeper/CredentialState.h"
#include "tokenkeeper/RefreshScheduler.hpp"
#include "tokenkeeper/RetryingInvoker.hpp"
#include "tokenkeeper/ServiceClient.h"

namespace tokenkeeper {

//==========================================================================================================
// TokenAutoUpdateClient
// Purpose: Wraps an IServiceClient. A background RefreshScheduler renews the credential before it expires;
//          every remote operation runs through RetryingInvoker so a call rejected for an expired credential
//          is refreshed and retried transparently.
//==========================================================================================================
class TokenAutoUpdateClient : public IServiceClient {
public:
    //==========================================================================================================
    // Options
    // Purpose: Construction-time configuration, fixed for the client's lifetime.
    // Fields:
    //   maxTryTimes: Maximum executions of one operation (first call plus retries). 0 behaves as 1.
    //   minFetchIntervalMs: Debounce window between credential refresh attempts.
    //   backoffMinMs/backoffMaxMs: Clamp range of the delay before a refresh that follows failures.
    //   initialExpiresAt: Expiry of a credential already installed in the inner client. The default (epoch)
    //                     means no valid credential is known yet.
    //==========================================================================================================
    struct Options {
        unsigned int maxTryTimes{3u};
        unsigned int minFetchIntervalMs{1000u};
        unsigned int backoffMinMs{1000u};
        unsigned int backoffMaxMs{60000u};
        std::chrono::system_clock::time_point initialExpiresAt{};
    };

    //==========================================================================================================
    // Builds the layer and starts the refresh scheduler. When opts.initialExpiresAt is not in the future, one
    // refresh runs before the scheduler starts; its failure is logged and left to the scheduler and to
    // reactive retries.
    // Args:
    //   inner: Underlying client that executes operations and signs requests (required).
    //   issuer: Credential-issuing function (required).
    //   opts: Retry/refresh configuration.
    //   shutdown: Host shutdown token; a stop request on it stops the scheduler.
    //   clock: Time source; defaults to SystemClock.
    // Throws:
    //   std::invalid_argument when inner or issuer is empty.
    //==========================================================================================================
    TokenAutoUpdateClient(ServiceClientPtr inner,
                          TokenIssueFunction issuer,
                          const Options& opts,
                          std::stop_token shutdown = {},
                          std::shared_ptr<IClock> clock = nullptr);
    ~TokenAutoUpdateClient() override;

    TokenAutoUpdateClient(const TokenAutoUpdateClient&) = delete;
    TokenAutoUpdateClient& operator=(const TokenAutoUpdateClient&) = delete;

    ////////////////////////////////////////// Lifecycle //////////////////////////////////////////
    //==========================================================================================================
    // Marks the client closed; the scheduler exits after its current wait/fetch cycle. Operations keep
    // working (reactive refresh stays available) but callers should stop issuing them.
    //==========================================================================================================
    void Close();

    //==========================================================================================================
    // Runs one credential refresh attempt now, subject to the same debounce and backoff as every other.
    //==========================================================================================================
    std::optional<errors::FetchError> ForceRefresh();

    CredentialSnapshot Snapshot() const;
    bool IsSchedulerRunning() const;
    const Options& GetOptions() const { return options; }

    ////////////////////////////////////////// IServiceClient //////////////////////////////////////////
    void ResetAccessKeyToken(const std::string& accessKeyId,
                             const std::string& accessKeySecret,
                             const std::string& securityToken) override;
    void SetUserAgent(const std::string& userAgent) override;
    void SetRetryTimeout(std::chrono::milliseconds timeout) override;
    void SetAuthVersion(AuthVersion version) override;
    void SetRegion(const std::string& region) override;

    Outcome<LogProject> CreateProject(const std::string& name, const std::string& description) override;
    Outcome<LogProject> GetProject(const std::string& name) override;
    Outcome<LogProject> UpdateProject(const std::string& name, const std::string& description) override;
    Outcome<std::vector<std::string>> ListProject() override;
    Outcome<bool> CheckProjectExist(const std::string& name) override;
    Outcome<void> DeleteProject(const std::string& name) override;

    Outcome<void> CreateLogStore(const std::string& project, const LogStore& logstore) override;
    Outcome<LogStore> GetLogStore(const std::string& project, const std::string& logstore) override;
    Outcome<std::vector<std::string>> ListLogStore(const std::string& project) override;
    Outcome<void> UpdateLogStore(const std::string& project, const LogStore& logstore) override;
    Outcome<bool> CheckLogstoreExist(const std::string& project, const std::string& logstore) override;
    Outcome<void> DeleteLogStore(const std::string& project, const std::string& logstore) override;

    Outcome<void> CreateMachineGroup(const std::string& project, const MachineGroup& group) override;
    Outcome<MachineGroup> GetMachineGroup(const std::string& project, const std::string& name) override;
    Outcome<MachineGroupList> ListMachineGroup(const std::string& project, int offset, int size) override;
    Outcome<void> DeleteMachineGroup(const std::string& project, const std::string& name) override;

    Outcome<void> PutLogs(const std::string& project, const std::string& logstore, const LogGroup& group) override;

private:
    ServiceClientPtr inner;
    Options options;
    std::shared_ptr<IClock> clock;
    CredentialState state;
    CredentialFetcher fetcher;
    RetryingInvoker invoker;
    std::unique_ptr<RefreshScheduler> scheduler;
};

//==========================================================================================================
// TokenAutoUpdateClientFactory
// Purpose: Builds TokenAutoUpdateClient from a semicolon-delimited key=value config string after
//          installing an initial credential into the inner client.
//==========================================================================================================
class TokenAutoUpdateClientFactory {
public:
    //==========================================================================================================
    // CreateClient
    // Purpose: Parses config (keys: maxTryTimes, minFetchIntervalMs, backoffMinMs, backoffMaxMs), applies
    //          TOKENKEEPER_* environment overrides, fetches the first credential synchronously and returns
    //          the running client.
    // Throws:
    //   std::invalid_argument when inner or issuer is empty; std::runtime_error when the first fetch fails.
    //==========================================================================================================
    std::unique_ptr<TokenAutoUpdateClient> CreateClient(ServiceClientPtr inner,
                                                        TokenIssueFunction issuer,
                                                        const std::string& config,
                                                        std::stop_token shutdown = {},
                                                        std::shared_ptr<IClock> clock = nullptr);

    // Config-string parsing only. Unknown keys and malformed numbers are logged and ignored.
    static TokenAutoUpdateClient::Options ParseOptions(const std::string& config);

    // Applies TOKENKEEPER_MAX_TRY_TIMES, TOKENKEEPER_MIN_FETCH_INTERVAL_MS, TOKENKEEPER_BACKOFF_MIN_MS and
    // TOKENKEEPER_BACKOFF_MAX_MS when set.
    static void ApplyEnvOverrides(TokenAutoUpdateClient::Options& opts);
};

} // namespace tokenkeeper
