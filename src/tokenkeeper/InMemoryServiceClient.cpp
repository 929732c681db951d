//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryServiceClient.cpp
// Purpose: In-process log service client implementation
//==========================================================================================================

#include <atomic>
#include <map>
#include <mutex>
#include <string>

#include "logging/Logger.h"
#include "tokenkeeper/InMemoryServiceClient.hpp"

using namespace std::chrono;

namespace tokenkeeper {

using errors::ServiceError;
namespace codes = errors::ErrorCodes;

static std::int64_t nowSeconds() {
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

class InMemoryServiceClient::Impl {
public:
    struct ProjectEntry {
        LogProject project;
        std::map<std::string, LogStore> logstores;
        std::map<std::string, std::size_t> logCounts;
        std::map<std::string, MachineGroup> machineGroups;
    };

    CredentialValidator validator;
    mutable std::mutex mtx;
    std::string accessKeyId;
    std::string accessKeySecret;
    std::string securityToken;
    std::string userAgent;
    std::string region;
    AuthVersion authVersion{AuthVersion::V1};
    milliseconds retryTimeout{0};
    std::map<std::string, ProjectEntry> projects;
    std::atomic<unsigned long> credentialResets{0ul};
    std::atomic<unsigned long> operationCalls{0ul};
    std::atomic<unsigned long> requestCounter{0ul};

    explicit Impl(CredentialValidator v) : validator(std::move(v)) {}

    ServiceError makeError(int status, const std::string& code, const std::string& message) {
        ServiceError e;
        e.httpStatus = status;
        e.code = code;
        e.message = message;
        e.requestId = "mem-" + std::to_string(++requestCounter);
        return e;
    }

    // Runs before every operation; returns the 401 to report when the credential is rejected.
    std::optional<ServiceError> checkCredential() {
        ++operationCalls;
        std::string id, token;
        {
            std::lock_guard<std::mutex> lk(mtx);
            id = accessKeyId;
            token = securityToken;
        }
        const bool accepted = validator ? validator(id, token) : !id.empty();
        if (accepted) {
            return std::nullopt;
        }
        LOG_DEBUG("InMemoryServiceClient: credential rejected, id: '{}'", id);
        ServiceError e = makeError(401, codes::Unauthorized, "The security token you provided is invalid or expired.");
        e.wwwAuthenticate = "Bearer realm=\"log\", error=\"invalid_token\", error_description=\"credential rejected\"";
        return e;
    }

    // Caller holds mtx.
    ProjectEntry* findProject(const std::string& name) {
        auto it = projects.find(name);
        return it == projects.end() ? nullptr : &it->second;
    }

    ServiceError projectNotExist(const std::string& name) {
        return makeError(404, codes::ProjectNotExist, "Project " + name + " does not exist");
    }

    ServiceError invalidParameter(const std::string& what) {
        return makeError(400, codes::ParameterInvalid, what);
    }
};

InMemoryServiceClient::InMemoryServiceClient(CredentialValidator validator)
    : pImpl(std::make_unique<Impl>(std::move(validator))) {
}

InMemoryServiceClient::~InMemoryServiceClient() = default;

////////////////////////////////////////// Diagnostics //////////////////////////////////////////

unsigned long InMemoryServiceClient::CredentialResets() const {
    return pImpl->credentialResets.load();
}

unsigned long InMemoryServiceClient::OperationCalls() const {
    return pImpl->operationCalls.load();
}

std::string InMemoryServiceClient::CurrentAccessKeyId() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->accessKeyId;
}

std::string InMemoryServiceClient::CurrentSecurityToken() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->securityToken;
}

std::string InMemoryServiceClient::UserAgent() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->userAgent;
}

std::string InMemoryServiceClient::Region() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->region;
}

AuthVersion InMemoryServiceClient::GetAuthVersion() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->authVersion;
}

milliseconds InMemoryServiceClient::RetryTimeout() const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return pImpl->retryTimeout;
}

std::size_t InMemoryServiceClient::LogCount(const std::string& project, const std::string& logstore) const {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return 0;
    }
    auto it = p->logCounts.find(logstore);
    return it == p->logCounts.end() ? 0 : it->second;
}

////////////////////////////////////////// Configuration //////////////////////////////////////////

void InMemoryServiceClient::ResetAccessKeyToken(const std::string& accessKeyId,
                                                const std::string& accessKeySecret,
                                                const std::string& securityToken) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->accessKeyId = accessKeyId;
    pImpl->accessKeySecret = accessKeySecret;
    pImpl->securityToken = securityToken;
    ++pImpl->credentialResets;
}

void InMemoryServiceClient::SetUserAgent(const std::string& userAgent) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->userAgent = userAgent;
}

void InMemoryServiceClient::SetRetryTimeout(milliseconds timeout) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->retryTimeout = timeout;
}

void InMemoryServiceClient::SetAuthVersion(AuthVersion version) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->authVersion = version;
}

void InMemoryServiceClient::SetRegion(const std::string& region) {
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    pImpl->region = region;
}

////////////////////////////////////////// Projects //////////////////////////////////////////

Outcome<LogProject> InMemoryServiceClient::CreateProject(const std::string& name, const std::string& description) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<LogProject>::Failure(std::move(*err));
    }
    if (name.empty()) {
        return Outcome<LogProject>::Failure(pImpl->invalidParameter("project name must not be empty"));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    if (pImpl->findProject(name)) {
        return Outcome<LogProject>::Failure(
            pImpl->makeError(409, codes::ProjectAlreadyExist, "Project " + name + " already exist"));
    }
    Impl::ProjectEntry entry;
    entry.project.name = name;
    entry.project.description = description;
    entry.project.region = pImpl->region;
    entry.project.createTime = nowSeconds();
    entry.project.lastModifyTime = entry.project.createTime;
    LogProject created = entry.project;
    pImpl->projects.emplace(name, std::move(entry));
    return Outcome<LogProject>::Success(std::move(created));
}

Outcome<LogProject> InMemoryServiceClient::GetProject(const std::string& name) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<LogProject>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(name);
    if (!p) {
        return Outcome<LogProject>::Failure(pImpl->projectNotExist(name));
    }
    return Outcome<LogProject>::Success(p->project);
}

Outcome<LogProject> InMemoryServiceClient::UpdateProject(const std::string& name, const std::string& description) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<LogProject>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(name);
    if (!p) {
        return Outcome<LogProject>::Failure(pImpl->projectNotExist(name));
    }
    p->project.description = description;
    p->project.lastModifyTime = nowSeconds();
    return Outcome<LogProject>::Success(p->project);
}

Outcome<std::vector<std::string>> InMemoryServiceClient::ListProject() {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<std::vector<std::string>>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    std::vector<std::string> names;
    names.reserve(pImpl->projects.size());
    for (const auto& [name, entry] : pImpl->projects) {
        names.push_back(name);
    }
    return Outcome<std::vector<std::string>>::Success(std::move(names));
}

Outcome<bool> InMemoryServiceClient::CheckProjectExist(const std::string& name) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<bool>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    return Outcome<bool>::Success(pImpl->findProject(name) != nullptr);
}

Outcome<void> InMemoryServiceClient::DeleteProject(const std::string& name) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<void>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    if (pImpl->projects.erase(name) == 0) {
        return Outcome<void>::Failure(pImpl->projectNotExist(name));
    }
    return Outcome<void>::Success();
}

////////////////////////////////////////// Log stores //////////////////////////////////////////

Outcome<void> InMemoryServiceClient::CreateLogStore(const std::string& project, const LogStore& logstore) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<void>::Failure(std::move(*err));
    }
    if (logstore.name.empty() || logstore.shardCount <= 0) {
        return Outcome<void>::Failure(pImpl->invalidParameter("logstore requires a name and a positive shard count"));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<void>::Failure(pImpl->projectNotExist(project));
    }
    if (!p->logstores.emplace(logstore.name, logstore).second) {
        return Outcome<void>::Failure(
            pImpl->makeError(409, codes::LogStoreAlreadyExist, "Logstore " + logstore.name + " already exist"));
    }
    p->logCounts[logstore.name] = 0;
    return Outcome<void>::Success();
}

Outcome<LogStore> InMemoryServiceClient::GetLogStore(const std::string& project, const std::string& logstore) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<LogStore>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<LogStore>::Failure(pImpl->projectNotExist(project));
    }
    auto it = p->logstores.find(logstore);
    if (it == p->logstores.end()) {
        return Outcome<LogStore>::Failure(
            pImpl->makeError(404, codes::LogStoreNotExist, "Logstore " + logstore + " does not exist"));
    }
    return Outcome<LogStore>::Success(it->second);
}

Outcome<std::vector<std::string>> InMemoryServiceClient::ListLogStore(const std::string& project) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<std::vector<std::string>>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<std::vector<std::string>>::Failure(pImpl->projectNotExist(project));
    }
    std::vector<std::string> names;
    for (const auto& [name, ls] : p->logstores) {
        names.push_back(name);
    }
    return Outcome<std::vector<std::string>>::Success(std::move(names));
}

Outcome<void> InMemoryServiceClient::UpdateLogStore(const std::string& project, const LogStore& logstore) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<void>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<void>::Failure(pImpl->projectNotExist(project));
    }
    auto it = p->logstores.find(logstore.name);
    if (it == p->logstores.end()) {
        return Outcome<void>::Failure(
            pImpl->makeError(404, codes::LogStoreNotExist, "Logstore " + logstore.name + " does not exist"));
    }
    it->second = logstore;
    return Outcome<void>::Success();
}

Outcome<bool> InMemoryServiceClient::CheckLogstoreExist(const std::string& project, const std::string& logstore) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<bool>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<bool>::Failure(pImpl->projectNotExist(project));
    }
    return Outcome<bool>::Success(p->logstores.count(logstore) > 0);
}

Outcome<void> InMemoryServiceClient::DeleteLogStore(const std::string& project, const std::string& logstore) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<void>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<void>::Failure(pImpl->projectNotExist(project));
    }
    if (p->logstores.erase(logstore) == 0) {
        return Outcome<void>::Failure(
            pImpl->makeError(404, codes::LogStoreNotExist, "Logstore " + logstore + " does not exist"));
    }
    p->logCounts.erase(logstore);
    return Outcome<void>::Success();
}

////////////////////////////////////////// Machine groups //////////////////////////////////////////

Outcome<void> InMemoryServiceClient::CreateMachineGroup(const std::string& project, const MachineGroup& group) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<void>::Failure(std::move(*err));
    }
    if (group.name.empty()) {
        return Outcome<void>::Failure(pImpl->invalidParameter("machine group name must not be empty"));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<void>::Failure(pImpl->projectNotExist(project));
    }
    if (!p->machineGroups.emplace(group.name, group).second) {
        return Outcome<void>::Failure(pImpl->makeError(409, codes::MachineGroupAlreadyExist,
                                                       "MachineGroup " + group.name + " already exist"));
    }
    return Outcome<void>::Success();
}

Outcome<MachineGroup> InMemoryServiceClient::GetMachineGroup(const std::string& project, const std::string& name) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<MachineGroup>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<MachineGroup>::Failure(pImpl->projectNotExist(project));
    }
    auto it = p->machineGroups.find(name);
    if (it == p->machineGroups.end()) {
        return Outcome<MachineGroup>::Failure(
            pImpl->makeError(404, codes::MachineGroupNotExist, "MachineGroup " + name + " does not exist"));
    }
    return Outcome<MachineGroup>::Success(it->second);
}

Outcome<MachineGroupList> InMemoryServiceClient::ListMachineGroup(const std::string& project, int offset, int size) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<MachineGroupList>::Failure(std::move(*err));
    }
    if (offset < 0 || size < 0) {
        return Outcome<MachineGroupList>::Failure(pImpl->invalidParameter("offset and size must not be negative"));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<MachineGroupList>::Failure(pImpl->projectNotExist(project));
    }
    MachineGroupList list;
    list.total = static_cast<int>(p->machineGroups.size());
    int index = 0;
    for (const auto& [name, group] : p->machineGroups) {
        if (index >= offset && static_cast<int>(list.names.size()) < size) {
            list.names.push_back(name);
        }
        ++index;
    }
    return Outcome<MachineGroupList>::Success(std::move(list));
}

Outcome<void> InMemoryServiceClient::DeleteMachineGroup(const std::string& project, const std::string& name) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<void>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<void>::Failure(pImpl->projectNotExist(project));
    }
    if (p->machineGroups.erase(name) == 0) {
        return Outcome<void>::Failure(
            pImpl->makeError(404, codes::MachineGroupNotExist, "MachineGroup " + name + " does not exist"));
    }
    return Outcome<void>::Success();
}

////////////////////////////////////////// Log ingestion //////////////////////////////////////////

Outcome<void> InMemoryServiceClient::PutLogs(const std::string& project, const std::string& logstore, const LogGroup& group) {
    if (auto err = pImpl->checkCredential()) {
        return Outcome<void>::Failure(std::move(*err));
    }
    std::lock_guard<std::mutex> lk(pImpl->mtx);
    auto* p = pImpl->findProject(project);
    if (!p) {
        return Outcome<void>::Failure(pImpl->projectNotExist(project));
    }
    auto it = p->logCounts.find(logstore);
    if (it == p->logCounts.end()) {
        return Outcome<void>::Failure(
            pImpl->makeError(404, codes::LogStoreNotExist, "Logstore " + logstore + " does not exist"));
    }
    it->second += group.logs.size();
    return Outcome<void>::Success();
}

} // namespace tokenkeeper
