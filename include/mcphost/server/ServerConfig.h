//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Launch description for one stdio tool server
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcphost {

//==========================================================================================================
// ServerConfig
// Purpose: How to start a tool server process.
// Fields:
//   command: Executable name, resolved through PATH when it contains no '/'.
//   args: Arguments passed after argv[0].
//   env: Variables overlaid on the current process environment. Values here win.
//==========================================================================================================
struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::map<std::string, std::string>> env;
};

} // namespace mcphost
