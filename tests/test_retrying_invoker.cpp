//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_retrying_invoker.cpp
// Purpose: Tests for retry-on-credential-rejection around remote operations
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "tokenkeeper/Outcome.h"
#include "tokenkeeper/RetryingInvoker.hpp"

using namespace tokenkeeper;
using errors::ServiceError;

namespace {

ServiceError authError() {
    ServiceError e;
    e.httpStatus = 401;
    e.code = errors::ErrorCodes::Unauthorized;
    e.message = "token expired";
    e.requestId = "req-auth";
    return e;
}

ServiceError notFound() {
    ServiceError e;
    e.httpStatus = 404;
    e.code = errors::ErrorCodes::ProjectNotExist;
    e.message = "Project demo does not exist";
    return e;
}

struct RefreshCounter {
    int calls{0};
    bool fail{false};

    RetryingInvoker::RefreshFunction Fn() {
        return [this]() -> std::optional<errors::FetchError> {
            ++calls;
            if (fail) {
                return errors::makeCredentialFetchError("issuer offline");
            }
            return std::nullopt;
        };
    }
};

} // namespace

TEST(RetryingInvoker, SuccessRunsOnce) {
    RefreshCounter refresh;
    RetryingInvoker invoker(refresh.Fn(), 3u);
    int calls = 0;
    auto out = invoker.Invoke([&]() { ++calls; return Outcome<int>::Success(7); });
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(*out.value, 7);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(refresh.calls, 0);
}

TEST(RetryingInvoker, NonAuthErrorIsNeverRetried) {
    RefreshCounter refresh;
    RetryingInvoker invoker(refresh.Fn(), 5u);
    int calls = 0;
    auto out = invoker.Invoke([&]() { ++calls; return Outcome<int>::Failure(notFound()); });
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error->code, errors::ErrorCodes::ProjectNotExist);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(refresh.calls, 0);
}

TEST(RetryingInvoker, AuthErrorsThenSuccess) {
    RefreshCounter refresh;
    RetryingInvoker invoker(refresh.Fn(), 3u);
    int calls = 0;
    auto out = invoker.Invoke([&]() {
        ++calls;
        return calls < 3 ? Outcome<std::string>::Failure(authError()) : Outcome<std::string>::Success("ok");
    });
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(*out.value, "ok");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(refresh.calls, 2);
}

TEST(RetryingInvoker, FailedRefreshReturnsOriginalError) {
    RefreshCounter refresh;
    refresh.fail = true;
    RetryingInvoker invoker(refresh.Fn(), 3u);
    int calls = 0;
    auto out = invoker.Invoke([&]() { ++calls; return Outcome<void>::Failure(authError()); });
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error->httpStatus, 401);
    EXPECT_EQ(out.error->code, errors::ErrorCodes::Unauthorized);
    EXPECT_EQ(out.error->requestId, "req-auth");
    ASSERT_TRUE(out.error->cause.has_value());
    EXPECT_EQ(out.error->cause->category, errors::ErrorCategory::CredentialFetch);
    EXPECT_EQ(out.error->cause->message, "issuer offline");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(refresh.calls, 1);
}

TEST(RetryingInvoker, DebouncedRefreshStopsRetry) {
    int calls = 0;
    RetryingInvoker invoker([]() -> std::optional<errors::FetchError> { return errors::makeHighFrequencyError(); },
                            3u);
    auto out = invoker.Invoke([&]() { ++calls; return Outcome<int>::Failure(authError()); });
    ASSERT_FALSE(out.ok());
    ASSERT_TRUE(out.error->cause.has_value());
    EXPECT_TRUE(out.error->cause->IsHighFrequency());
    EXPECT_EQ(calls, 1);
}

TEST(RetryingInvoker, ExhaustedAttemptsReturnLastAuthError) {
    RefreshCounter refresh;
    RetryingInvoker invoker(refresh.Fn(), 3u);
    int calls = 0;
    auto out = invoker.Invoke([&]() {
        ++calls;
        ServiceError e = authError();
        e.requestId = "req-" + std::to_string(calls);
        return Outcome<int>::Failure(e);
    });
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(out.error->requestId, "req-3");
    EXPECT_FALSE(out.error->cause.has_value());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(refresh.calls, 3);
}

TEST(RetryingInvoker, ZeroMaxTryTimesRunsOnce) {
    RefreshCounter refresh;
    RetryingInvoker invoker(refresh.Fn(), 0u);
    EXPECT_EQ(invoker.MaxTryTimes(), 1u);
    int calls = 0;
    auto out = invoker.Invoke([&]() { ++calls; return Outcome<int>::Failure(authError()); });
    EXPECT_FALSE(out.ok());
    EXPECT_EQ(calls, 1);
}

TEST(RetryingInvoker, CredentialCodesWithoutStatusAreRetried) {
    RefreshCounter refresh;
    RetryingInvoker invoker(refresh.Fn(), 2u);
    int calls = 0;
    auto out = invoker.Invoke([&]() {
        ++calls;
        if (calls == 1) {
            ServiceError e;
            e.httpStatus = 400;
            e.code = errors::ErrorCodes::SecurityTokenExpired;
            return Outcome<int>::Failure(e);
        }
        return Outcome<int>::Success(1);
    });
    EXPECT_TRUE(out.ok());
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(refresh.calls, 1);
}

TEST(RetryingInvoker, EmptyRefreshRejected) {
    EXPECT_THROW(RetryingInvoker(RetryingInvoker::RefreshFunction{}, 3u), std::invalid_argument);
}
