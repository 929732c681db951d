//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigString.h
// Purpose: Parsing of semicolon-delimited key=value configuration strings used by the factories
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace tokenkeeper {

using ConfigEntries = std::vector<std::pair<std::string, std::string>>;

//==========================================================================================================
// parseConfigString
// Purpose: Splits "k1=v1; k2 = v2" into trimmed (key, value) pairs in input order. Segments without '='
//          and empty segments are skipped.
//==========================================================================================================
ConfigEntries parseConfigString(const std::string& config);

//==========================================================================================================
// parseUnsignedValue
// Purpose: Parses a non-negative decimal integer that fits in unsigned int.
// Returns:
//   true and sets out on success; false (out untouched) and logs a warning naming key otherwise.
//==========================================================================================================
bool parseUnsignedValue(const std::string& key, const std::string& value, unsigned int& out);

} // namespace tokenkeeper
