//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryServiceClient.hpp
// Purpose: In-process log service client for tests and embedding
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "tokenkeeper/ServiceClient.h"

namespace tokenkeeper {

//==========================================================================================================
// InMemoryServiceClient
// Purpose: Implements IServiceClient against in-process maps instead of a remote endpoint. Every operation
//          first checks the installed credential with a CredentialValidator; a rejected credential fails
//          with HTTP 401 "Unauthorized" and a Bearer invalid_token challenge, as the remote service does.
//==========================================================================================================
class InMemoryServiceClient : public IServiceClient {
public:
    // Decides whether the currently installed credential is accepted.
    using CredentialValidator = std::function<bool(const std::string& accessKeyId,
                                                   const std::string& securityToken)>;

    //==========================================================================================================
    // Args:
    //   validator: Credential check run before each operation. When empty, any credential with a non-empty
    //              access key id is accepted.
    //==========================================================================================================
    explicit InMemoryServiceClient(CredentialValidator validator = nullptr);
    ~InMemoryServiceClient() override;

    ////////////////////////////////////////// Diagnostics //////////////////////////////////////////
    unsigned long CredentialResets() const;
    unsigned long OperationCalls() const;
    std::string CurrentAccessKeyId() const;
    std::string CurrentSecurityToken() const;
    std::string UserAgent() const;
    std::string Region() const;
    AuthVersion GetAuthVersion() const;
    std::chrono::milliseconds RetryTimeout() const;

    //==========================================================================================================
    // Number of log records stored in project/logstore (0 when either does not exist).
    //==========================================================================================================
    std::size_t LogCount(const std::string& project, const std::string& logstore) const;

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
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace tokenkeeper
