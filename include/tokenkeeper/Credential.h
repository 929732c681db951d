//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Credential.h
// Purpose: Short-lived access credential and the credential-issuing function contract
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace tokenkeeper {

//==========================================================================================================
// Credential
// Purpose: Access identity used to sign remote operations.
// Fields:
//   accessKeyId/accessKeySecret: Temporary key pair.
//   securityToken: Session token bound to the key pair.
//   expiresAt: Wall-clock time after which the remote side rejects the credential.
//==========================================================================================================
struct Credential {
    std::string accessKeyId;
    std::string accessKeySecret;
    std::string securityToken;
    std::chrono::system_clock::time_point expiresAt{};
};

//==========================================================================================================
// IssueResult
// Purpose: Outcome of one call to the credential issuer. Exactly one of credential/error is meaningful:
//          error set means the issuer failed.
//==========================================================================================================
struct IssueResult {
    Credential credential;
    std::optional<std::string> error;

    static IssueResult Success(Credential c) {
        IssueResult r;
        r.credential = std::move(c);
        return r;
    }

    static IssueResult Failure(std::string message) {
        IssueResult r;
        r.error = std::move(message);
        return r;
    }

    bool ok() const { return !error.has_value(); }
};

// External collaborator that mints a new credential.
using TokenIssueFunction = std::function<IssueResult()>;

} // namespace tokenkeeper
