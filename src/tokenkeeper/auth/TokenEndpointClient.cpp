//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenEndpointClient.cpp
// Purpose: Coroutine HTTP/HTTPS form POST used to talk to credential token endpoints
//==========================================================================================================

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "tokenkeeper/auth/TokenEndpointClient.hpp"

namespace tokenkeeper::auth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

struct UrlParts { std::string scheme, host, port, path; };

static UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

template <typename Stream>
static void setDeadline(Stream& s, unsigned int ms) {
    if (ms > 0) {
        s.expires_after(std::chrono::milliseconds(ms));
    } else {
        s.expires_never();
    }
}

static http::request<http::string_body> makeRequest(const UrlParts& u, const std::string& hostHeader,
                                                    const TokenFetchParams& params, const std::string& body) {
    http::request<http::string_body> req{http::verb::post, u.path, 11};
    req.set(http::field::host, hostHeader);
    req.set(http::field::content_type, "application/x-www-form-urlencoded");
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    if (!params.userAgent.empty()) {
        req.set(http::field::user_agent, params.userAgent);
    }
    req.body() = body;
    req.prepare_payload();
    return req;
}

static std::unique_ptr<ssl::context> makeVerifyingContext(const TokenFetchParams& params) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    ::SSL_CTX_set_max_proto_version(ctx->native_handle(), TLS1_3_VERSION);
    if (!params.caFile.empty()) {
        ctx->load_verify_file(params.caFile);
    }
    if (!params.caPath.empty()) {
        ctx->add_verify_path(params.caPath);
    }
    if (params.caFile.empty() && params.caPath.empty()) {
        ctx->set_default_verify_paths();
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

net::awaitable<HttpReply> coPostFormUrlencoded(
    const TokenFetchParams& params,
    const std::string& body,
    ssl::context* sslCtxOpt) {
    UrlParts u = parseUrl(params.url);
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
    LOG_DEBUG("token endpoint resolved {}:{} path={}", u.host, u.port, u.path);

    HttpReply reply;
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;

    if (u.scheme == "https") {
        ssl::context* ctxPtr = sslCtxOpt;
        std::unique_ptr<ssl::context> localCtx;
        if (!ctxPtr) {
            localCtx = makeVerifyingContext(params);
            ctxPtr = localCtx.get();
        }
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *ctxPtr);
        const std::string sni = params.serverName.empty() ? u.host : params.serverName;
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), sni.c_str())) {
            LOG_WARN("token endpoint: setting SNI '{}' failed", sni);
        }
        (void)::SSL_set1_host(stream.native_handle(), sni.c_str());

        setDeadline(stream.next_layer(), params.connectTimeoutMs);
        co_await stream.next_layer().async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        LOG_DEBUG("token endpoint https handshake complete");

        auto req = makeRequest(u, sni, params, body);
        setDeadline(stream.next_layer(), params.readTimeoutMs);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.shutdown(ec);
    } else {
        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        setDeadline(stream, params.connectTimeoutMs);
        co_await stream.async_connect(results, net::use_awaitable);

        auto req = makeRequest(u, u.host, params, body);
        setDeadline(stream, params.readTimeoutMs);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    reply.status = static_cast<int>(res.result_int());
    reply.body = std::move(res.body());
    LOG_DEBUG("token endpoint replied status={} bytes={}", reply.status, reply.body.size());
    co_return reply;
}

std::string urlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

} // namespace tokenkeeper::auth
