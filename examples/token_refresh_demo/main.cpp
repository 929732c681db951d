//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example keeping short-lived credentials fresh across expiry while issuing log operations
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "tokenkeeper/InMemoryServiceClient.hpp"
#include "tokenkeeper/TokenAutoUpdateClient.hpp"
#include "tokenkeeper/version.h"

using namespace std::chrono;
using namespace tokenkeeper;

// Local stand-in for an STS endpoint: mints tokens that live two seconds and remembers their expiry.
class LocalIssuer {
public:
    IssueResult Issue() {
        const int n = ++counter;
        Credential c;
        c.accessKeyId = "STS.demo" + std::to_string(n);
        c.accessKeySecret = "secret-" + std::to_string(n);
        c.securityToken = "token-" + std::to_string(n);
        c.expiresAt = system_clock::now() + seconds(2);
        std::lock_guard<std::mutex> lk(mtx);
        expiry[c.securityToken] = c.expiresAt;
        return IssueResult::Success(c);
    }

    bool Accepts(const std::string& token) {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = expiry.find(token);
        return it != expiry.end() && system_clock::now() < it->second;
    }

    int Issued() const { return counter.load(); }

private:
    std::atomic<int> counter{0};
    std::mutex mtx;
    std::map<std::string, system_clock::time_point> expiry;
};

int main() {
    std::cout << "tokenkeeper " << getVersionString() << std::endl;

    auto issuer = std::make_shared<LocalIssuer>();
    auto service = std::make_shared<InMemoryServiceClient>(
        [issuer](const std::string&, const std::string& token) { return issuer->Accepts(token); });

    std::stop_source shutdown;
    TokenAutoUpdateClientFactory factory;
    auto client = factory.CreateClient(service, [issuer]() { return issuer->Issue(); },
                                       "maxTryTimes=3; minFetchIntervalMs=200; backoffMinMs=100; backoffMaxMs=1000",
                                       shutdown.get_token());
    client->SetUserAgent("token-refresh-demo");

    auto created = client->CreateProject("demo-project", "credential refresh demo");
    if (!created.ok()) {
        std::cerr << "CreateProject failed: " << created.error->ToString() << std::endl;
        return 1;
    }
    LogStore store;
    store.name = "app-logs";
    auto storeOut = client->CreateLogStore("demo-project", store);
    if (!storeOut.ok()) {
        std::cerr << "CreateLogStore failed: " << storeOut.error->ToString() << std::endl;
        return 1;
    }

    // Keep writing for longer than the credential lifetime; expired tokens are refreshed in-band.
    int failures = 0;
    for (int i = 0; i < 12; ++i) {
        LogGroup group;
        group.topic = "demo";
        LogRecord rec;
        rec.time = static_cast<std::uint32_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
        rec.contents = {{"seq", std::to_string(i)}, {"msg", "hello"}};
        group.logs.push_back(rec);
        auto out = client->PutLogs("demo-project", "app-logs", group);
        if (!out.ok()) {
            ++failures;
            std::cerr << "PutLogs #" << i << " failed: " << out.error->ToString() << std::endl;
        }
        std::this_thread::sleep_for(milliseconds(500));
    }

    shutdown.request_stop();
    while (client->IsSchedulerRunning()) {
        std::this_thread::sleep_for(milliseconds(10));
    }

    const auto snap = client->Snapshot();
    std::cout << "records stored: " << service->LogCount("demo-project", "app-logs") << "\n"
              << "failed writes: " << failures << "\n"
              << "credentials issued: " << issuer->Issued() << "\n"
              << "credential installs: " << service->CredentialResets() << "\n"
              << "consecutive fetch failures: " << snap.consecutiveFailures << std::endl;
    LOG_INFO("token_refresh_demo: done");
    return failures == 0 ? 0 : 1;
}
