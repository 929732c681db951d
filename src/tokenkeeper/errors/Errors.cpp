//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Classification of operation errors into credential-rejection vs. everything else
//==========================================================================================================

#include "tokenkeeper/errors/Errors.h"

#include <sstream>

#include "tokenkeeper/auth/WwwAuthenticate.hpp"

namespace tokenkeeper {
namespace errors {

std::string ServiceError::ToString() const {
    std::ostringstream oss;
    oss << "{httpStatus:" << httpStatus << ", code:" << code << ", message:" << message;
    if (!requestId.empty()) {
        oss << ", requestId:" << requestId;
    }
    if (cause.has_value()) {
        oss << ", cause:" << categoryName(cause->category) << ": " << cause->message;
    }
    oss << "}";
    return oss.str();
}

bool isAuthInvalid(const ServiceError& err) {
    if (err.httpStatus == 401) {
        return true;
    }
    if (err.code == ErrorCodes::Unauthorized ||
        err.code == ErrorCodes::InvalidAccessKeyId ||
        err.code == ErrorCodes::InvalidAccessKeyIdNotFound ||
        err.code == ErrorCodes::SecurityTokenExpired ||
        err.code == ErrorCodes::InvalidSecurityToken ||
        err.code == ErrorCodes::SignatureNotMatch) {
        return true;
    }
    return auth::isInvalidTokenChallenge(err.wwwAuthenticate);
}

} // namespace errors
} // namespace tokenkeeper
