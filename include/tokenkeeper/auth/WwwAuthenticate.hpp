//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.hpp
// Purpose: Parser for HTTP WWW-Authenticate Bearer challenges used to classify rejected credentials
//==========================================================================================================

#pragma once

#include <string>
#include <unordered_map>

namespace tokenkeeper::auth {

//==========================================================================================================
// WwwAuthChallenge
// Purpose: Parsed representation of a single WWW-Authenticate challenge line.
//==========================================================================================================
struct WwwAuthChallenge {
    std::string scheme;                                          // "bearer" (lower-case)
    std::unordered_map<std::string, std::string> params;         // lower-case key -> unquoted value
};

//==========================================================================================================
// parseWwwAuthenticate
// Purpose: Parse a single WWW-Authenticate header value with the Bearer scheme and comma-separated
//          key=value parameters (values may be quoted). Returns true on successful parse.
// Notes:
//   - Returns false for other schemes (e.g., Basic) and for malformed quoted values.
//==========================================================================================================
bool parseWwwAuthenticate(const std::string& header, WwwAuthChallenge& out);

//==========================================================================================================
// isInvalidTokenChallenge
// Purpose: True when the header is a Bearer challenge whose error parameter is "invalid_token"
//          (RFC 6750 §3.1: the access token is expired, revoked, malformed, or invalid).
//==========================================================================================================
bool isInvalidTokenChallenge(const std::string& header);

} // namespace tokenkeeper::auth
