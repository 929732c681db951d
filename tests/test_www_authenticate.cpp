//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_www_authenticate.cpp
// Purpose: Unit tests for WWW-Authenticate parser and invalid_token detection
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "tokenkeeper/auth/WwwAuthenticate.hpp"

using namespace tokenkeeper::auth;

TEST(WwwAuthenticate, ParseBearerWithRealmAndError) {
    const std::string h = "Bearer realm=\"sls\", error=\"invalid_token\", error_description=\"token expired\"";
    WwwAuthChallenge c;
    ASSERT_TRUE(parseWwwAuthenticate(h, c));
    EXPECT_EQ(c.scheme, std::string("bearer"));
    EXPECT_EQ(c.params["realm"], std::string("sls"));
    EXPECT_EQ(c.params["error"], std::string("invalid_token"));
    EXPECT_EQ(c.params["error_description"], std::string("token expired"));
}

TEST(WwwAuthenticate, ParseBearerWithoutParams) {
    WwwAuthChallenge c;
    ASSERT_TRUE(parseWwwAuthenticate("Bearer", c));
    EXPECT_EQ(c.scheme, std::string("bearer"));
    EXPECT_TRUE(c.params.empty());
}

TEST(WwwAuthenticate, SchemeAndKeysAreCaseInsensitive) {
    WwwAuthChallenge c;
    ASSERT_TRUE(parseWwwAuthenticate("BEARER Error=invalid_token , Scope = logs:write ", c));
    EXPECT_EQ(c.params["error"], std::string("invalid_token"));
    EXPECT_EQ(c.params["scope"], std::string("logs:write"));
}

TEST(WwwAuthenticate, RejectNonBearerScheme) {
    WwwAuthChallenge c;
    EXPECT_FALSE(parseWwwAuthenticate("Basic realm=\"X\"", c));
}

TEST(WwwAuthenticate, RejectUnterminatedQuote) {
    WwwAuthChallenge c;
    EXPECT_FALSE(parseWwwAuthenticate("Bearer error=\"invalid_token", c));
}

TEST(WwwAuthenticate, HandleQuotedEscapes) {
    const std::string h = R"(Bearer error="insufficient_scope", error_description="need \"logs:write\"")";
    WwwAuthChallenge c;
    ASSERT_TRUE(parseWwwAuthenticate(h, c));
    EXPECT_EQ(c.params["error"], std::string("insufficient_scope"));
    EXPECT_EQ(c.params["error_description"], std::string("need \"logs:write\""));
}

TEST(WwwAuthenticate, InvalidTokenChallengeDetection) {
    EXPECT_TRUE(isInvalidTokenChallenge("Bearer error=\"invalid_token\""));
    EXPECT_TRUE(isInvalidTokenChallenge("Bearer realm=\"x\", error=invalid_token"));
    EXPECT_FALSE(isInvalidTokenChallenge("Bearer error=\"insufficient_scope\""));
    EXPECT_FALSE(isInvalidTokenChallenge("Bearer realm=\"x\""));
    EXPECT_FALSE(isInvalidTokenChallenge("Basic realm=\"x\""));
    EXPECT_FALSE(isInvalidTokenChallenge(""));
}
