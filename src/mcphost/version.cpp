//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers; components come from the build (MCPHOST_VERSION_* definitions).
//==========================================================================================================
#include "mcphost/version.h"

#include <format>

#ifndef MCPHOST_VERSION_MAJOR
#define MCPHOST_VERSION_MAJOR 0
#endif
#ifndef MCPHOST_VERSION_MINOR
#define MCPHOST_VERSION_MINOR 1
#endif
#ifndef MCPHOST_VERSION_PATCH
#define MCPHOST_VERSION_PATCH 0
#endif

namespace mcphost {

VersionInfo getVersion() {
    return VersionInfo{MCPHOST_VERSION_MAJOR, MCPHOST_VERSION_MINOR, MCPHOST_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcphost
