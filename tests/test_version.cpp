//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_version.cpp
// Purpose: Tests for the semantic version helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "tokenkeeper/version.h"

TEST(Version, StringMatchesComponents) {
    const auto v = tokenkeeper::getVersion();
    EXPECT_GE(v.major, 0);
    EXPECT_GE(v.minor, 0);
    EXPECT_GE(v.patch, 0);
    const std::string expected = std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch);
    EXPECT_EQ(tokenkeeper::getVersionString(), expected);
}
