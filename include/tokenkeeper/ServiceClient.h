//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServiceClient.h
// Purpose: Log service client interface - uniform (result, error) contract for every remote operation
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "tokenkeeper/Outcome.h"
#include "tokenkeeper/ServiceTypes.h"

namespace tokenkeeper {

//==========================================================================================================
// IServiceClient
// Purpose: Authenticated log service client. Implementations own the credential used for request signing
//          and synchronize access to it themselves.
//==========================================================================================================
class IServiceClient {
public:
    virtual ~IServiceClient() = default;

    ////////////////////////////////////////// Credential & configuration //////////////////////////////////////////
    //==========================================================================================================
    // Replaces the credential used to sign subsequent requests.
    // Args:
    //   accessKeyId, accessKeySecret, securityToken: The new credential.
    // Returns:
    //   (none)
    //==========================================================================================================
    virtual void ResetAccessKeyToken(const std::string& accessKeyId,
                                     const std::string& accessKeySecret,
                                     const std::string& securityToken) = 0;

    virtual void SetUserAgent(const std::string& userAgent) = 0;
    virtual void SetRetryTimeout(std::chrono::milliseconds timeout) = 0;
    virtual void SetAuthVersion(AuthVersion version) = 0;

    //==========================================================================================================
    // Sets the service region; required when signing with AuthVersion::V4.
    //==========================================================================================================
    virtual void SetRegion(const std::string& region) = 0;

    ////////////////////////////////////////// Projects //////////////////////////////////////////
    virtual Outcome<LogProject> CreateProject(const std::string& name, const std::string& description) = 0;
    virtual Outcome<LogProject> GetProject(const std::string& name) = 0;
    virtual Outcome<LogProject> UpdateProject(const std::string& name, const std::string& description) = 0;
    virtual Outcome<std::vector<std::string>> ListProject() = 0;
    virtual Outcome<bool> CheckProjectExist(const std::string& name) = 0;
    virtual Outcome<void> DeleteProject(const std::string& name) = 0;

    ////////////////////////////////////////// Log stores //////////////////////////////////////////
    virtual Outcome<void> CreateLogStore(const std::string& project, const LogStore& logstore) = 0;
    virtual Outcome<LogStore> GetLogStore(const std::string& project, const std::string& logstore) = 0;
    virtual Outcome<std::vector<std::string>> ListLogStore(const std::string& project) = 0;

    //==========================================================================================================
    // Updates ttl/shard settings of an existing log store identified by logstore.name.
    //==========================================================================================================
    virtual Outcome<void> UpdateLogStore(const std::string& project, const LogStore& logstore) = 0;
    virtual Outcome<bool> CheckLogstoreExist(const std::string& project, const std::string& logstore) = 0;
    virtual Outcome<void> DeleteLogStore(const std::string& project, const std::string& logstore) = 0;

    ////////////////////////////////////////// Machine groups //////////////////////////////////////////
    virtual Outcome<void> CreateMachineGroup(const std::string& project, const MachineGroup& group) = 0;
    virtual Outcome<MachineGroup> GetMachineGroup(const std::string& project, const std::string& name) = 0;

    //==========================================================================================================
    // Lists machine group names in pages.
    // Args:
    //   offset: Index of the first group to return.
    //   size: Maximum number of names to return.
    // Returns:
    //   Page of names plus the total number of groups in the project.
    //==========================================================================================================
    virtual Outcome<MachineGroupList> ListMachineGroup(const std::string& project, int offset, int size) = 0;
    virtual Outcome<void> DeleteMachineGroup(const std::string& project, const std::string& name) = 0;

    ////////////////////////////////////////// Log ingestion //////////////////////////////////////////
    virtual Outcome<void> PutLogs(const std::string& project, const std::string& logstore, const LogGroup& group) = 0;
};

using ServiceClientPtr = std::shared_ptr<IServiceClient>;

} // namespace tokenkeeper
