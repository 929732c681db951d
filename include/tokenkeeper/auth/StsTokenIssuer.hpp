//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StsTokenIssuer.hpp
// Purpose: Credential issuer that obtains temporary credentials from an STS-style HTTP token endpoint
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "tokenkeeper/Credential.h"

namespace tokenkeeper::auth {

//==========================================================================================================
// StsTokenIssuer
// Purpose: Requests a temporary credential with a client_credentials form POST and parses the JSON reply.
//          Each Issue() call performs one blocking round trip on a private io_context.
//==========================================================================================================
class StsTokenIssuer {
public:
    struct Options {
        std::string tokenUrl;
        std::string clientId;
        std::string clientSecret;
        std::string scope;
        std::string roleArn;
        std::string sessionName;
        std::string serverName;     // TLS SNI / host verification override
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{5000u};
        unsigned int readTimeoutMs{10000u};
    };

    explicit StsTokenIssuer(Options opts);

    //==========================================================================================================
    // Issue
    // Purpose: Performs one token request.
    // Returns:
    //   IssueResult::Success with the parsed credential, or IssueResult::Failure naming the transport error,
    //   the non-2xx status (with the service Code/Message when present) or the missing field.
    //==========================================================================================================
    IssueResult Issue() const;

    //==========================================================================================================
    // AsIssueFunction
    // Purpose: Adapts a copy of this issuer to the TokenIssueFunction signature consumed by the refresh layer.
    //==========================================================================================================
    TokenIssueFunction AsIssueFunction() const;

    // x-www-form-urlencoded request body; empty optional fields are omitted.
    std::string BuildFormBody() const;

    const Options& GetOptions() const { return options; }

    //==========================================================================================================
    // ParseTokenResponse
    // Purpose: Extracts AccessKeyId, AccessKeySecret and SecurityToken from a token endpoint JSON body (flat or
    //          nested under "Credentials"). Expiry comes from "Expiration" (RFC 3339) when present, otherwise
    //          from "expires_in" seconds counted from now.
    //==========================================================================================================
    static IssueResult ParseTokenResponse(const std::string& body, std::chrono::system_clock::time_point now);

    // Parses "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)"; fractional seconds are dropped.
    static std::optional<std::chrono::system_clock::time_point> ParseRfc3339(const std::string& text);

private:
    Options options;
};

//==========================================================================================================
// StsTokenIssuerFactory
// Purpose: Builds an StsTokenIssuer from "key=value; ..." configuration. Keys: tokenUrl, clientId,
//          clientSecret, scope, roleArn, sessionName, serverName, caFile, caPath, connectTimeoutMs,
//          readTimeoutMs. Throws std::invalid_argument when tokenUrl is missing.
//==========================================================================================================
class StsTokenIssuerFactory {
public:
    static std::unique_ptr<StsTokenIssuer> CreateIssuer(const std::string& config);
};

} // namespace tokenkeeper::auth
