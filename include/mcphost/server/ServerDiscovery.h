//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDiscovery.h
// Purpose: Protocol handshake and capability enumeration for launched tool servers
//==========================================================================================================

#pragma once

#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "mcphost/Client.h"
#include "mcphost/Protocol.h"
#include "mcphost/Transport.h"
#include "mcphost/server/ProcessHandle.h"
#include "mcphost/server/ServerErrors.h"

namespace mcphost {

// Per-call progress of one DiscoverCapabilities invocation.
enum class DiscoveryState {
    NotStarted,
    Starting,
    Ready,
    Discovering,
    Active,
    Error
};

const char* ToString(DiscoveryState state);

// Live protocol client plus what the server advertised.
struct DiscoveredServer {
    std::shared_ptr<IClient> client;
    CapabilitySet capabilities;
};

//==========================================================================================================
// NormalizeTool
// Purpose: Converts a raw tools/list entry. The schema is read from "inputSchema" or the legacy
//          "parameters" key; "type" is forced to "object" and an empty "properties" object is supplied.
// Returns:
//   nullopt when the entry is not an object with a non-empty string name.
//==========================================================================================================
std::optional<Tool> NormalizeTool(const JSONValue& raw);

// Converts a raw resources/list entry. Requires a string uri; name defaults to the uri and type to
// "resource".
std::optional<Resource> NormalizeResource(const JSONValue& raw);

//==========================================================================================================
// IServerDiscovery
//==========================================================================================================
class IServerDiscovery {
public:
    virtual ~IServerDiscovery() = default;

    //==========================================================================================================
    // DiscoverCapabilities
    // Purpose: Binds a transport to the process, performs the initialize handshake and lists tools and
    //          resources. The process is expected to be live already; its health is not re-checked.
    // Args:
    //   name: Server name (logging, errors).
    //   process: Launched process.
    // Returns:
    //   Future with the connected client and normalized capabilities. Fails with DiscoveryError whose
    //   message reads "Server connection failed: ...", "Protocol handshake failed: ..." or the
    //   underlying failure, e.g. "No capabilities discovered".
    //==========================================================================================================
    virtual std::future<DiscoveredServer> DiscoverCapabilities(const std::string& name,
                                                               std::shared_ptr<ProcessHandle> process) = 0;

    //==========================================================================================================
    // DiscoverAllCapabilities
    // Purpose: Discovers every server concurrently. All or nothing: when any server fails, the future
    //          fails with DiscoveryError("One or more servers failed capability discovery") once every
    //          attempt has finished, with one cause per failed server.
    //==========================================================================================================
    virtual std::future<std::map<std::string, DiscoveredServer>> DiscoverAllCapabilities(
        const std::map<std::string, std::shared_ptr<ProcessHandle>>& processes) = 0;
};

class ServerDiscovery : public IServerDiscovery {
public:
    // Newline-delimited stdio transports and the standard Client.
    ServerDiscovery();
    ServerDiscovery(std::shared_ptr<IProcessTransportFactory> transportFactory,
                    std::shared_ptr<IClientFactory> clientFactory);
    ServerDiscovery(std::shared_ptr<IProcessTransportFactory> transportFactory,
                    std::shared_ptr<IClientFactory> clientFactory,
                    Implementation clientInfo);
    ~ServerDiscovery() override;

    std::future<DiscoveredServer> DiscoverCapabilities(const std::string& name,
                                                       std::shared_ptr<ProcessHandle> process) override;

    std::future<std::map<std::string, DiscoveredServer>> DiscoverAllCapabilities(
        const std::map<std::string, std::shared_ptr<ProcessHandle>>& processes) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphost
