//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StsTokenIssuer.cpp
// Purpose: Credential issuer that obtains temporary credentials from an STS-style HTTP token endpoint
//==========================================================================================================

#include <charconv>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "logging/Logger.h"
#include "tokenkeeper/ConfigString.h"
#include "tokenkeeper/auth/StsTokenIssuer.hpp"
#include "tokenkeeper/auth/TokenEndpointClient.hpp"
#include "tokenkeeper/version.h"

using namespace std::chrono;

namespace tokenkeeper::auth {
namespace net = boost::asio;

static void skipSpace(const std::string& json, std::size_t& i) {
    while (i < json.size() && (json[i] == ' ' || json[i] == '\t' || json[i] == '\r' || json[i] == '\n')) {
        ++i;
    }
}

// Locates the value that follows "key": and leaves i on its first character.
static bool findJsonValue(const std::string& json, const std::string& key, std::size_t& i) {
    const std::string needle = "\"" + key + "\"";
    std::size_t k = json.find(needle);
    while (k != std::string::npos) {
        i = k + needle.size();
        skipSpace(json, i);
        if (i < json.size() && json[i] == ':') {
            ++i;
            skipSpace(json, i);
            return i < json.size();
        }
        k = json.find(needle, k + 1);
    }
    return false;
}

static bool parseJsonStringField(const std::string& json, const std::string& key, std::string& out) {
    out.clear();
    std::size_t i = 0;
    if (!findJsonValue(json, key, i) || json[i] != '"') {
        return false;
    }
    std::string value;
    for (++i; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') {
            out = std::move(value);
            return true;
        }
        if (c == '\\') {
            if (i + 1 >= json.size()) {
                return false;
            }
            char n = json[++i];
            switch (n) {
                case '"': case '\\': case '/': value.push_back(n); break;
                case 'n': value.push_back('\n'); break;
                case 't': value.push_back('\t'); break;
                case 'r': value.push_back('\r'); break;
                default: return false; // \uXXXX does not occur in credential fields
            }
            continue;
        }
        value.push_back(c);
    }
    return false;
}

static bool parseJsonIntField(const std::string& json, const std::string& key, long long& out) {
    std::size_t i = 0;
    if (!findJsonValue(json, key, i)) {
        return false;
    }
    const char* first = json.data() + i;
    const char* last = json.data() + json.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr != first;
}

static bool readDigits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
    if (pos + n > s.size()) {
        return false;
    }
    int v = 0;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::optional<system_clock::time_point> StsTokenIssuer::ParseRfc3339(const std::string& text) {
    int yr = 0, mo = 0, dy = 0, hh = 0, mm = 0, ss = 0;
    if (text.size() < 20 ||
        !readDigits(text, 0, 4, yr) || text[4] != '-' ||
        !readDigits(text, 5, 2, mo) || text[7] != '-' ||
        !readDigits(text, 8, 2, dy) || (text[10] != 'T' && text[10] != 't') ||
        !readDigits(text, 11, 2, hh) || text[13] != ':' ||
        !readDigits(text, 14, 2, mm) || text[16] != ':' ||
        !readDigits(text, 17, 2, ss)) {
        return std::nullopt;
    }
    std::size_t pos = 19;
    if (text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            ++pos;
        }
    }
    if (pos >= text.size()) {
        return std::nullopt;
    }
    int offsetMinutes = 0;
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int oh = 0, om = 0;
        if (!readDigits(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
            !readDigits(text, pos + 4, 2, om)) {
            return std::nullopt;
        }
        offsetMinutes = (text[pos] == '-' ? -1 : 1) * (oh * 60 + om);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    const year_month_day ymd{year{yr}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(dy)}};
    if (!ymd.ok() || hh > 23 || mm > 59 || ss > 60) {
        return std::nullopt;
    }
    const auto utc = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss} - minutes{offsetMinutes};
    return time_point_cast<system_clock::duration>(utc);
}

IssueResult StsTokenIssuer::ParseTokenResponse(const std::string& body, system_clock::time_point now) {
    Credential c;
    if (!parseJsonStringField(body, "AccessKeyId", c.accessKeyId) || c.accessKeyId.empty()) {
        return IssueResult::Failure("token response missing AccessKeyId");
    }
    if (!parseJsonStringField(body, "AccessKeySecret", c.accessKeySecret) || c.accessKeySecret.empty()) {
        return IssueResult::Failure("token response missing AccessKeySecret");
    }
    if (!parseJsonStringField(body, "SecurityToken", c.securityToken) || c.securityToken.empty()) {
        return IssueResult::Failure("token response missing SecurityToken");
    }
    std::string expiration;
    long long expiresIn = 0;
    if (parseJsonStringField(body, "Expiration", expiration)) {
        auto tp = ParseRfc3339(expiration);
        if (!tp) {
            return IssueResult::Failure("token response has malformed Expiration '" + expiration + "'");
        }
        c.expiresAt = *tp;
    } else if (parseJsonIntField(body, "expires_in", expiresIn) && expiresIn > 0) {
        c.expiresAt = now + seconds(expiresIn);
    } else {
        return IssueResult::Failure("token response carries neither Expiration nor expires_in");
    }
    return IssueResult::Success(std::move(c));
}

StsTokenIssuer::StsTokenIssuer(Options opts) : options(std::move(opts)) {
    if (options.tokenUrl.empty()) {
        throw std::invalid_argument("StsTokenIssuer: tokenUrl must not be empty");
    }
}

std::string StsTokenIssuer::BuildFormBody() const {
    std::ostringstream form;
    form << "grant_type=client_credentials";
    if (!options.clientId.empty()) { form << "&client_id=" << urlEncodeForm(options.clientId); }
    if (!options.clientSecret.empty()) { form << "&client_secret=" << urlEncodeForm(options.clientSecret); }
    if (!options.scope.empty()) { form << "&scope=" << urlEncodeForm(options.scope); }
    if (!options.roleArn.empty()) { form << "&role_arn=" << urlEncodeForm(options.roleArn); }
    if (!options.sessionName.empty()) { form << "&session_name=" << urlEncodeForm(options.sessionName); }
    return form.str();
}

IssueResult StsTokenIssuer::Issue() const {
    FUNC_SCOPE();
    TokenFetchParams params;
    params.url = options.tokenUrl;
    params.serverName = options.serverName;
    params.caFile = options.caFile;
    params.caPath = options.caPath;
    params.userAgent = "tokenkeeper/" + getVersionString();
    params.connectTimeoutMs = options.connectTimeoutMs;
    params.readTimeoutMs = options.readTimeoutMs;

    // The coroutine holds references to params and body until ioc.run() returns.
    const std::string body = BuildFormBody();
    HttpReply reply;
    try {
        net::io_context ioc;
        auto fut = net::co_spawn(ioc, coPostFormUrlencoded(params, body, nullptr), net::use_future);
        ioc.run();
        reply = fut.get();
    } catch (const std::exception& e) {
        LOG_WARN("StsTokenIssuer: request to {} failed: {}", options.tokenUrl, e.what());
        return IssueResult::Failure(std::string("token endpoint request failed: ") + e.what());
    }

    if (reply.status < 200 || reply.status >= 300) {
        std::string code, message;
        (void)parseJsonStringField(reply.body, "Code", code);
        (void)parseJsonStringField(reply.body, "Message", message);
        std::string detail = code.empty() ? reply.body.substr(0, 200) : code + ": " + message;
        LOG_WARN("StsTokenIssuer: token endpoint returned HTTP {}", reply.status);
        return IssueResult::Failure("token endpoint returned HTTP " + std::to_string(reply.status) + ": " + detail);
    }
    if (reply.body.empty()) {
        return IssueResult::Failure("empty response from token endpoint");
    }
    return ParseTokenResponse(reply.body, system_clock::now());
}

TokenIssueFunction StsTokenIssuer::AsIssueFunction() const {
    auto self = std::make_shared<const StsTokenIssuer>(*this);
    return [self]() { return self->Issue(); };
}

//==========================================================================================================
// StsTokenIssuerFactory
//==========================================================================================================
std::unique_ptr<StsTokenIssuer> StsTokenIssuerFactory::CreateIssuer(const std::string& config) {
    StsTokenIssuer::Options opts;
    for (const auto& [key, val] : parseConfigString(config)) {
        if (key == "tokenUrl") { opts.tokenUrl = val; }
        else if (key == "clientId") { opts.clientId = val; }
        else if (key == "clientSecret") { opts.clientSecret = val; }
        else if (key == "scope") { opts.scope = val; }
        else if (key == "roleArn") { opts.roleArn = val; }
        else if (key == "sessionName") { opts.sessionName = val; }
        else if (key == "serverName") { opts.serverName = val; }
        else if (key == "caFile") { opts.caFile = val; }
        else if (key == "caPath") { opts.caPath = val; }
        else if (key == "connectTimeoutMs") { (void)parseUnsignedValue(key, val, opts.connectTimeoutMs); }
        else if (key == "readTimeoutMs") { (void)parseUnsignedValue(key, val, opts.readTimeoutMs); }
        else {
            LOG_WARN("StsTokenIssuerFactory: unknown config key '{}'", key);
        }
    }
    return std::make_unique<StsTokenIssuer>(std::move(opts));
}

} // namespace tokenkeeper::auth
