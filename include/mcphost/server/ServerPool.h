//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerPool.h
// Purpose: Shared registry of discovered servers with session reference tracking
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/server/ServerConfig.h"
#include "mcphost/server/ServerDiscovery.h"
#include "mcphost/server/ServerLauncher.h"

namespace mcphost {

//==========================================================================================================
// ServerPool
// Purpose: Caches {client, capabilities} per server name and tracks which sessions use which servers.
//          A server no session references any more is torn down through IServerLauncher::Cleanup.
// Notes:
//   - Construct once and share; Reset() returns it to the empty state for test isolation.
//   - The pool installs itself as the launcher's exit handler so a crashed server leaves the cache.
//==========================================================================================================
class ServerPool {
public:
    ServerPool(std::shared_ptr<IServerLauncher> launcher, std::shared_ptr<IServerDiscovery> discovery);
    ~ServerPool();

    ServerPool(const ServerPool&) = delete;
    ServerPool& operator=(const ServerPool&) = delete;

    //==========================================================================================================
    // GetOrCreateServer
    // Purpose: Returns the cached server or launches and discovers it.
    // Args:
    //   name: Server name.
    //   config: Used only when the server is not cached yet.
    // Returns:
    //   Shared future with the client and capabilities. Concurrent callers for a name that is not cached
    //   share one creation. A failed creation leaves neither a process nor a cache entry behind and
    //   fails with the launcher's ServerError or the DiscoveryError.
    //==========================================================================================================
    std::shared_future<DiscoveredServer> GetOrCreateServer(const std::string& name, const ServerConfig& config);

    void RegisterSessionServer(const std::string& sessionId, const std::string& name);

    //==========================================================================================================
    // ReleaseSessionServers
    // Purpose: Drops every reference held by the session. Servers left without sessions are untracked by
    //          the launcher and purged from the cache before this returns. A server still being created
    //          finishes its creation first and is torn down right after, if still unreferenced.
    //==========================================================================================================
    void ReleaseSessionServers(const std::string& sessionId);

    bool HasServer(const std::string& name) const;

    // Sorted server names referenced by the session.
    std::vector<std::string> GetSessionServers(const std::string& sessionId) const;

    // Sorted session ids referencing the server.
    std::vector<std::string> GetServerSessions(const std::string& name) const;

    // Tears the server down if no session references it. Returns true when a cached server was removed,
    // or when the server is still starting and will be torn down once its creation completes.
    bool CleanupUnusedServer(const std::string& name);

    // Cached entry, without creating one.
    std::optional<DiscoveredServer> GetServer(const std::string& name) const;

    // Stops every launched server and forgets all servers, sessions and in-flight creations.
    void Reset();

    // Not supported: throws std::logic_error.
    std::shared_future<DiscoveredServer> RestartServer(const std::string& name);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphost
