//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_config_string.cpp
// Purpose: Tests for "key=value; ..." configuration parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include "tokenkeeper/ConfigString.h"

using namespace tokenkeeper;

TEST(ConfigString, SplitsAndTrims) {
    auto entries = parseConfigString(" maxTryTimes = 5 ;backoffMinMs=200;; novalue ; =orphan; tokenUrl=http://h:1/a=b ");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].first, "maxTryTimes");
    EXPECT_EQ(entries[0].second, "5");
    EXPECT_EQ(entries[1].first, "backoffMinMs");
    EXPECT_EQ(entries[1].second, "200");
    EXPECT_EQ(entries[2].first, "tokenUrl");
    EXPECT_EQ(entries[2].second, "http://h:1/a=b");
}

TEST(ConfigString, EmptyInput) {
    EXPECT_TRUE(parseConfigString("").empty());
    EXPECT_TRUE(parseConfigString(" ; ; ").empty());
}

TEST(ConfigString, UnsignedValues) {
    unsigned int v = 42u;
    EXPECT_TRUE(parseUnsignedValue("k", "0", v));
    EXPECT_EQ(v, 0u);
    EXPECT_TRUE(parseUnsignedValue("k", "60000", v));
    EXPECT_EQ(v, 60000u);

    EXPECT_FALSE(parseUnsignedValue("k", "", v));
    EXPECT_FALSE(parseUnsignedValue("k", "-1", v));
    EXPECT_FALSE(parseUnsignedValue("k", "+3", v));
    EXPECT_FALSE(parseUnsignedValue("k", "12ms", v));
    EXPECT_FALSE(parseUnsignedValue("k", "abc", v));
    EXPECT_FALSE(parseUnsignedValue("k", "99999999999999999999999", v));
    EXPECT_EQ(v, 60000u);
}
