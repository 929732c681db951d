//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServiceTypes.h
// Purpose: Resource types exchanged with the log service client
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tokenkeeper {

// Request signing scheme understood by the underlying client.
enum class AuthVersion {
    V1,
    V4
};

struct LogProject {
    std::string name;
    std::string description;
    std::string region;
    std::string status{"Normal"};
    std::int64_t createTime{0};
    std::int64_t lastModifyTime{0};
};

struct LogStore {
    std::string name;
    int ttl{30};
    int shardCount{2};
    bool autoSplit{false};
    int maxSplitShard{0};
    std::string telemetryType;
};

struct MachineGroup {
    std::string name;
    std::string machineIdentifyType{"ip"};
    std::string groupType;
    std::vector<std::string> machineIdList;
};

struct MachineGroupList {
    std::vector<std::string> names;
    int total{0};
};

struct LogRecord {
    std::uint32_t time{0};
    std::vector<std::pair<std::string, std::string>> contents;
};

struct LogGroup {
    std::string topic;
    std::string source;
    std::vector<LogRecord> logs;
};

} // namespace tokenkeeper
