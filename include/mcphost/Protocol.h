//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures and constants shared by the client, discovery and pool
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcphost {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

//==========================================================================================================
// InitializeResult
// Purpose: What a server answers to "initialize". Capabilities are kept as the raw object.
//==========================================================================================================
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    JSONValue capabilities;
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// Tool
// Purpose: Normalized tool description.
// Fields:
//   inputSchema: Always an object with "type":"object" and a "properties" object; "required" is kept
//                when the server sent it.
//==========================================================================================================
struct Tool {
    std::string name;
    std::optional<std::string> description;
    JSONValue inputSchema;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string name;
    std::string type;
    std::optional<std::string> description;
    std::string uri;
    std::optional<std::string> mimeType;
};

//==========================================================================================================
// CapabilitySet
// Purpose: Everything discovery learned about one server.
//==========================================================================================================
struct CapabilitySet {
    std::vector<Tool> tools;
    std::vector<Resource> resources;

    bool empty() const { return tools.empty() && resources.empty(); }
};

/////////////////////////////////////// Paged list results /////////////////////////////////////////
// One page of a list call; items are left raw so normalization can accept legacy shapes.
struct ListPage {
    std::vector<JSONValue> items;
    std::optional<std::string> nextCursor;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace mcphost
