//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version, also announced as clientInfo during the initialize handshake.
//==========================================================================================================
#pragma once

#include <string>

namespace mcphost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Version the library was built as (the CMake project version).
VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// Client name sent in clientInfo.
constexpr const char* kClientName = "mcphost";

} // namespace mcphost
