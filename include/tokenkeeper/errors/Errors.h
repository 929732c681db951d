//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures and classification helpers for the token refresh layer
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace tokenkeeper {
namespace errors {

// Categorization of every failure this layer produces or inspects.
enum class ErrorCategory {
    HighFrequency,      // refresh requested inside the debounce window; no attempt was made
    CredentialFetch,    // the credential issuer failed
    AuthInvalid,        // remote side rejected the credential used by an operation
    Operation,          // any other operation failure
    Unknown
};

// Human-readable category name for logs.
inline const char* categoryName(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::HighFrequency: return "HighFrequency";
        case ErrorCategory::CredentialFetch: return "CredentialFetch";
        case ErrorCategory::AuthInvalid: return "AuthInvalid";
        case ErrorCategory::Operation: return "Operation";
        default: return "Unknown";
    }
}

// Well-known service error codes.
namespace ErrorCodes {
    inline constexpr const char* Unauthorized = "Unauthorized";
    inline constexpr const char* InvalidAccessKeyId = "InvalidAccessKeyId";
    inline constexpr const char* InvalidAccessKeyIdNotFound = "InvalidAccessKeyId.NotFound";
    inline constexpr const char* SecurityTokenExpired = "SecurityTokenExpired";
    inline constexpr const char* InvalidSecurityToken = "InvalidSecurityToken";
    inline constexpr const char* SignatureNotMatch = "SignatureNotMatch";
    inline constexpr const char* ParameterInvalid = "ParameterInvalid";
    inline constexpr const char* ProjectNotExist = "ProjectNotExist";
    inline constexpr const char* ProjectAlreadyExist = "ProjectAlreadyExist";
    inline constexpr const char* LogStoreNotExist = "LogStoreNotExist";
    inline constexpr const char* LogStoreAlreadyExist = "LogStoreAlreadyExist";
    inline constexpr const char* MachineGroupNotExist = "MachineGroupNotExist";
    inline constexpr const char* MachineGroupAlreadyExist = "MachineGroupAlreadyExist";
    inline constexpr const char* InternalServerError = "InternalServerError";
}

//==========================================================================================================
// FetchError
// Purpose: Result of a failed credential refresh attempt.
// Fields:
//   category: HighFrequency (throttled, nothing attempted) or CredentialFetch (issuer failed).
//   message: Description; for CredentialFetch this carries the issuer's error text.
//==========================================================================================================
struct FetchError {
    ErrorCategory category{ErrorCategory::CredentialFetch};
    std::string message;

    bool IsHighFrequency() const { return category == ErrorCategory::HighFrequency; }
};

inline FetchError makeHighFrequencyError() {
    FetchError e;
    e.category = ErrorCategory::HighFrequency;
    e.message = "credential fetch frequency is too high";
    return e;
}

inline FetchError makeCredentialFetchError(std::string cause) {
    FetchError e;
    e.category = ErrorCategory::CredentialFetch;
    e.message = std::move(cause);
    return e;
}

//==========================================================================================================
// ServiceError
// Purpose: Failure reported by a remote operation of the underlying client.
// Fields:
//   httpStatus: HTTP status of the failed call (0 when the failure happened before a response).
//   code: Service error code (e.g. "Unauthorized", "ProjectNotExist").
//   message: Service error message.
//   requestId: Server-assigned request id when available.
//   wwwAuthenticate: Raw WWW-Authenticate challenge when the service sent one.
//   cause: Secondary diagnostic attached by the retry layer (a refresh that failed while handling this error).
//==========================================================================================================
struct ServiceError {
    int httpStatus{0};
    std::string code;
    std::string message;
    std::string requestId;
    std::string wwwAuthenticate;
    std::optional<FetchError> cause;

    std::string ToString() const;
};

// True when the error signals that the credential used by the operation was rejected or expired.
bool isAuthInvalid(const ServiceError& err);

// Category of an operation error: AuthInvalid or Operation.
inline ErrorCategory classify(const ServiceError& err) {
    return isAuthInvalid(err) ? ErrorCategory::AuthInvalid : ErrorCategory::Operation;
}

} // namespace errors
} // namespace tokenkeeper
