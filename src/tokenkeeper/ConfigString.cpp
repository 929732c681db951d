//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigString.cpp
// Purpose: Parsing of semicolon-delimited key=value configuration strings used by the factories
//==========================================================================================================

#include "tokenkeeper/ConfigString.h"

#include <limits>
#include <stdexcept>

#include "logging/Logger.h"

namespace tokenkeeper {

static std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

ConfigEntries parseConfigString(const std::string& config) {
    ConfigEntries entries;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        std::string kv = trim(config.substr(start, sep - start));
        std::size_t eq = kv.find('=');
        if (!kv.empty() && eq != std::string::npos) {
            std::string key = trim(kv.substr(0, eq));
            if (!key.empty()) {
                entries.emplace_back(key, trim(kv.substr(eq + 1)));
            }
        }
        start = sep + 1;
    }
    return entries;
}

bool parseUnsignedValue(const std::string& key, const std::string& value, unsigned int& out) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        LOG_WARN("config: ignoring malformed value for {}: '{}'", key, value);
        return false;
    }
    try {
        std::size_t consumed = 0;
        unsigned long v = std::stoul(value, &consumed);
        if (consumed != value.size() || v > std::numeric_limits<unsigned int>::max()) {
            LOG_WARN("config: ignoring malformed value for {}: '{}'", key, value);
            return false;
        }
        out = static_cast<unsigned int>(v);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("config: ignoring malformed value for {}: '{}' ({})", key, value, e.what());
        return false;
    }
}

} // namespace tokenkeeper
