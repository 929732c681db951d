//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenEndpointClient.hpp
// Purpose: Coroutine HTTP/HTTPS form POST used to talk to credential token endpoints
//==========================================================================================================
#pragma once

#include <string>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>

namespace tokenkeeper::auth {

struct TokenFetchParams {
    std::string url;
    std::string serverName;
    std::string caFile;
    std::string caPath;
    std::string userAgent;
    unsigned int connectTimeoutMs{0};
    unsigned int readTimeoutMs{0};
};

struct HttpReply {
    int status{0};
    std::string body;
};

//==========================================================================================================
// coPostFormUrlencoded
// Purpose: POSTs an application/x-www-form-urlencoded body to params.url and reads the full response.
//          https URLs use TLS 1.3 with peer verification against caFile/caPath (or the system store).
// Args:
//   params: Endpoint and timeouts; a zero timeout disables that deadline.
//   body: Already-encoded form body.
//   sslCtxOpt: Optional TLS context; a verifying TLS 1.3 client context is created when null.
// Returns:
//   HttpReply with the status code and body. Resolve, connect, TLS and I/O failures propagate as exceptions.
//==========================================================================================================
boost::asio::awaitable<HttpReply> coPostFormUrlencoded(
    const TokenFetchParams& params,
    const std::string& body,
    boost::asio::ssl::context* sslCtxOpt);

//==========================================================================================================
// urlEncodeForm
// Purpose: Encodes s for an x-www-form-urlencoded body (space as '+', unreserved characters kept).
//==========================================================================================================
std::string urlEncodeForm(const std::string& s);

} // namespace tokenkeeper::auth
