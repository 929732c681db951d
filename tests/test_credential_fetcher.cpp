//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_credential_fetcher.cpp
// Purpose: Tests for the debounced, backoff-throttled credential refresh routine
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ManualClock.h"
#include "tokenkeeper/CredentialFetcher.hpp"
#include "tokenkeeper/InMemoryServiceClient.hpp"

using namespace std::chrono;
using namespace tokenkeeper;

namespace {

struct FetcherFixture {
    std::shared_ptr<testutil::ManualClock> clock = std::make_shared<testutil::ManualClock>();
    CredentialState state;
    InMemoryServiceClient client;
    std::vector<IssueResult> script;   // consumed front to back; the last entry repeats
    std::size_t next{0};

    TokenIssueFunction Issuer() {
        return [this]() {
            IssueResult r = script[next < script.size() ? next : script.size() - 1];
            ++next;
            return r;
        };
    }

    FetchPolicy Policy(milliseconds minInterval, milliseconds lo, milliseconds hi) {
        FetchPolicy p;
        p.minFetchInterval = minInterval;
        p.backoffMin = lo;
        p.backoffMax = hi;
        return p;
    }

    // consecutiveFailures == 0 exactly when currentBackoff == 0.
    void ExpectBackoffMatchesFailures() {
        auto snap = state.Snapshot();
        EXPECT_EQ(snap.consecutiveFailures == 0u, snap.currentBackoff == milliseconds(0))
            << "failures=" << snap.consecutiveFailures << " backoff=" << snap.currentBackoff.count() << "ms";
    }

    Credential Cred(const std::string& id, system_clock::time_point exp) {
        Credential c;
        c.accessKeyId = id;
        c.accessKeySecret = id + "-secret";
        c.securityToken = id + "-token";
        c.expiresAt = exp;
        return c;
    }
};

} // namespace

TEST(CredentialFetcher, NextBackoffDoublesAndClamps) {
    const milliseconds lo(1000), hi(60000);
    EXPECT_EQ(CredentialFetcher::NextBackoff(milliseconds(0), lo, hi), milliseconds(1000));
    EXPECT_EQ(CredentialFetcher::NextBackoff(milliseconds(300), lo, hi), milliseconds(1000));
    EXPECT_EQ(CredentialFetcher::NextBackoff(milliseconds(1000), lo, hi), milliseconds(2000));
    EXPECT_EQ(CredentialFetcher::NextBackoff(milliseconds(16000), lo, hi), milliseconds(32000));
    EXPECT_EQ(CredentialFetcher::NextBackoff(milliseconds(30000), lo, hi), milliseconds(60000));
    EXPECT_EQ(CredentialFetcher::NextBackoff(milliseconds(45000), lo, hi), milliseconds(60000));
}

TEST(CredentialFetcher, SuccessInstallsCredentialOnce) {
    FetcherFixture fx;
    const auto exp = fx.clock->Now() + hours(1);
    fx.script = {IssueResult::Success(fx.Cred("AK1", exp))};
    CredentialFetcher fetcher(fx.state, fx.client, fx.Issuer(), FetchPolicy{}, fx.clock);

    auto err = fetcher.Fetch();
    EXPECT_FALSE(err.has_value());
    EXPECT_EQ(fx.client.CredentialResets(), 1ul);
    EXPECT_EQ(fx.client.CurrentAccessKeyId(), "AK1");
    EXPECT_EQ(fx.client.CurrentSecurityToken(), "AK1-token");
    auto snap = fx.state.Snapshot();
    EXPECT_EQ(snap.expiresAt, exp);
    ASSERT_TRUE(snap.lastFetchAt.has_value());
    EXPECT_EQ(*snap.lastFetchAt, fx.clock->SteadyNow());
    EXPECT_EQ(snap.consecutiveFailures, 0u);
    EXPECT_EQ(snap.currentBackoff, milliseconds(0));
    EXPECT_TRUE(fx.clock->Sleeps().empty());
}

TEST(CredentialFetcher, SecondCallInsideWindowIsHighFrequency) {
    FetcherFixture fx;
    fx.script = {IssueResult::Success(fx.Cred("AK1", fx.clock->Now() + hours(1)))};
    CredentialFetcher fetcher(fx.state, fx.client, fx.Issuer(), FetchPolicy{}, fx.clock);

    ASSERT_FALSE(fetcher.Fetch().has_value());
    const auto before = fx.state.Snapshot();

    fx.clock->Advance(milliseconds(999));
    auto err = fetcher.Fetch();
    ASSERT_TRUE(err.has_value());
    EXPECT_TRUE(err->IsHighFrequency());
    EXPECT_EQ(err->category, errors::ErrorCategory::HighFrequency);
    EXPECT_EQ(fetcher.IssuerCalls(), 1ul);
    EXPECT_EQ(fx.client.CredentialResets(), 1ul);
    const auto after = fx.state.Snapshot();
    EXPECT_EQ(after.lastFetchAt, before.lastFetchAt);
    EXPECT_EQ(after.expiresAt, before.expiresAt);

    // The window is half-open: exactly minFetchInterval later is allowed.
    fx.clock->Advance(milliseconds(1));
    EXPECT_FALSE(fetcher.Fetch().has_value());
    EXPECT_EQ(fetcher.IssuerCalls(), 2ul);
}

TEST(CredentialFetcher, FailureDoesNotTouchClient) {
    FetcherFixture fx;
    fx.script = {IssueResult::Failure("sts unavailable")};
    CredentialFetcher fetcher(fx.state, fx.client, fx.Issuer(), FetchPolicy{}, fx.clock);

    auto err = fetcher.Fetch();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->category, errors::ErrorCategory::CredentialFetch);
    EXPECT_EQ(err->message, "sts unavailable");
    EXPECT_EQ(fx.client.CredentialResets(), 0ul);
    EXPECT_EQ(fx.state.Snapshot().consecutiveFailures, 1u);
    EXPECT_EQ(fx.state.Snapshot().currentBackoff, milliseconds(1000));
    EXPECT_EQ(fx.state.Snapshot().expiresAt, system_clock::time_point{});
    fx.ExpectBackoffMatchesFailures();
}

TEST(CredentialFetcher, BackoffSequenceAndResetOnSuccess) {
    FetcherFixture fx;
    const auto exp = fx.clock->Now() + hours(2);
    fx.script = {IssueResult::Failure("e1"), IssueResult::Failure("e2"), IssueResult::Failure("e3"),
                 IssueResult::Failure("e4"), IssueResult::Failure("e5"), IssueResult::Failure("e6"),
                 IssueResult::Success(fx.Cred("AK2", exp))};
    CredentialFetcher fetcher(fx.state, fx.client, fx.Issuer(),
                              fx.Policy(milliseconds(1000), milliseconds(1000), milliseconds(8000)), fx.clock);

    fx.ExpectBackoffMatchesFailures();
    std::vector<milliseconds> backoffs;
    for (int i = 0; i < 6; ++i) {
        const auto prev = fx.state.Snapshot().currentBackoff;
        ASSERT_TRUE(fetcher.Fetch().has_value());
        auto snap = fx.state.Snapshot();
        EXPECT_EQ(snap.consecutiveFailures, static_cast<unsigned int>(i + 1));
        EXPECT_EQ(snap.currentBackoff, CredentialFetcher::NextBackoff(prev, milliseconds(1000), milliseconds(8000)));
        fx.ExpectBackoffMatchesFailures();
        backoffs.push_back(snap.currentBackoff);
        fx.clock->Advance(milliseconds(1000));
    }
    // Each failure doubles the stored delay within [1s, 8s].
    const std::vector<milliseconds> expected = {milliseconds(1000), milliseconds(2000), milliseconds(4000),
                                                milliseconds(8000), milliseconds(8000), milliseconds(8000)};
    EXPECT_EQ(backoffs, expected);
    // The first attempt runs without delay; each later one waits the delay stored by the failure before it.
    const std::vector<milliseconds> expectedSleeps(expected.begin(), expected.end() - 1);
    EXPECT_EQ(fx.clock->Sleeps(), expectedSleeps);

    // The successful attempt still waits out the clamped backoff, then clears it.
    EXPECT_FALSE(fetcher.Fetch().has_value());
    auto snap = fx.state.Snapshot();
    EXPECT_EQ(snap.consecutiveFailures, 0u);
    EXPECT_EQ(snap.currentBackoff, milliseconds(0));
    EXPECT_EQ(snap.expiresAt, exp);
    EXPECT_EQ(fx.clock->Sleeps().back(), milliseconds(8000));
    EXPECT_EQ(fx.client.CredentialResets(), 1ul);
    EXPECT_EQ(fetcher.IssuerCalls(), 7ul);
    fx.ExpectBackoffMatchesFailures();
}

TEST(CredentialFetcher, DebounceIgnoresWallClockSteps) {
    FetcherFixture fx;
    fx.script = {IssueResult::Success(fx.Cred("AK1", fx.clock->Now() + hours(1)))};
    CredentialFetcher fetcher(fx.state, fx.client, fx.Issuer(), FetchPolicy{}, fx.clock);
    ASSERT_FALSE(fetcher.Fetch().has_value());

    // Wall time jumps an hour back, then ten real seconds pass.
    fx.clock->StepWallClock(-duration_cast<milliseconds>(hours(1)));
    fx.clock->Advance(seconds(10));
    EXPECT_FALSE(fetcher.Fetch().has_value());
    EXPECT_EQ(fetcher.IssuerCalls(), 2ul);

    // A forward jump does not open the window early either.
    fx.clock->StepWallClock(duration_cast<milliseconds>(hours(2)));
    auto err = fetcher.Fetch();
    ASSERT_TRUE(err.has_value());
    EXPECT_TRUE(err->IsHighFrequency());
    EXPECT_EQ(fetcher.IssuerCalls(), 2ul);
}

TEST(CredentialFetcher, ConcurrentCallersShareOneIssuerCall) {
    FetcherFixture fx;
    fx.script = {IssueResult::Success(fx.Cred("AK1", fx.clock->Now() + hours(1)))};
    CredentialFetcher fetcher(fx.state, fx.client, fx.Issuer(), FetchPolicy{}, fx.clock);

    constexpr int kThreads = 16;
    std::atomic<int> succeeded{0};
    std::atomic<int> highFrequency{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto err = fetcher.Fetch();
            if (!err.has_value()) {
                succeeded.fetch_add(1);
            } else if (err->IsHighFrequency()) {
                highFrequency.fetch_add(1);
            }
        });
    }
    go.store(true);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(highFrequency.load(), kThreads - 1);
    EXPECT_EQ(fetcher.IssuerCalls(), 1ul);
    EXPECT_EQ(fx.client.CredentialResets(), 1ul);
}

TEST(CredentialFetcher, ExpiryNeverMovesBackwards) {
    FetcherFixture fx;
    const auto later = fx.clock->Now() + hours(3);
    const auto earlier = fx.clock->Now() + hours(1);
    fx.script = {IssueResult::Success(fx.Cred("AK1", later)), IssueResult::Success(fx.Cred("AK2", earlier))};
    CredentialFetcher fetcher(fx.state, fx.client, fx.Issuer(), FetchPolicy{}, fx.clock);

    ASSERT_FALSE(fetcher.Fetch().has_value());
    fx.clock->Advance(seconds(5));
    ASSERT_FALSE(fetcher.Fetch().has_value());
    EXPECT_EQ(fx.state.ExpiresAt(), later);
    // The new credential is still installed.
    EXPECT_EQ(fx.client.CurrentAccessKeyId(), "AK2");
    EXPECT_EQ(fx.client.CredentialResets(), 2ul);
}

TEST(CredentialFetcher, ThrowingIssuerBecomesFetchError) {
    FetcherFixture fx;
    CredentialFetcher fetcher(fx.state, fx.client,
                              []() -> IssueResult { throw std::runtime_error("socket closed"); },
                              FetchPolicy{}, fx.clock);
    auto err = fetcher.Fetch();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->category, errors::ErrorCategory::CredentialFetch);
    EXPECT_NE(err->message.find("socket closed"), std::string::npos);
    EXPECT_EQ(fx.state.Snapshot().consecutiveFailures, 1u);
}

TEST(CredentialFetcher, RejectsMissingCollaborators) {
    FetcherFixture fx;
    EXPECT_THROW(CredentialFetcher(fx.state, fx.client, TokenIssueFunction{}, FetchPolicy{}, fx.clock),
                 std::invalid_argument);
    EXPECT_THROW(CredentialFetcher(fx.state, fx.client, fx.Issuer(), FetchPolicy{}, nullptr),
                 std::invalid_argument);
}
