//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerPool.cpp
// Purpose: Server cache with single-flight creation and session reference tracking
//==========================================================================================================

#include <map>
#include <mutex>
#include <set>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcphost/async/Task.h"
#include "mcphost/server/ServerPool.h"

namespace mcphost {

namespace {

struct PoolEntry {
    std::shared_ptr<ProcessHandle> process;
    std::shared_ptr<IClient> client;
    CapabilitySet capabilities;
};

void disconnectQuietly(const std::string& name, const std::shared_ptr<IClient>& client) {
    if (!client) {
        return;
    }
    try {
        client->Disconnect().get();
    } catch (const std::exception& e) {
        LOG_WARN("Server {}: disconnect failed: {}", name, e.what());
    }
}

} // namespace

class ServerPool::Impl {
public:
    std::shared_ptr<IServerLauncher> launcher;
    std::shared_ptr<IServerDiscovery> discovery;

    mutable std::mutex mutex;
    std::map<std::string, PoolEntry> entries;
    std::map<std::string, std::shared_future<DiscoveredServer>> inflight;
    std::map<std::string, std::set<std::string>> sessionServers;
    std::map<std::string, std::set<std::string>> serverSessions;
    // Names whose teardown was requested while their creation was in flight.
    std::set<std::string> pendingTeardown;
    // Bumped by Reset so creations started before it do not repopulate the cache.
    uint64_t generation{0};

    // Removes the cache entry and the name from every session. Caller holds the mutex.
    std::shared_ptr<IClient> purgeLocked(const std::string& name) {
        std::shared_ptr<IClient> client;
        auto it = entries.find(name);
        if (it != entries.end()) {
            client = it->second.client;
            entries.erase(it);
        }
        auto sit = serverSessions.find(name);
        if (sit != serverSessions.end()) {
            for (const auto& sessionId : sit->second) {
                auto rit = sessionServers.find(sessionId);
                if (rit != sessionServers.end()) {
                    rit->second.erase(name);
                    if (rit->second.empty()) {
                        sessionServers.erase(rit);
                    }
                }
            }
            serverSessions.erase(sit);
        }
        return client;
    }

    bool referencedLocked(const std::string& name) const {
        auto it = serverSessions.find(name);
        return it != serverSessions.end() && !it->second.empty();
    }

    // Untracks the process while the mutex is held, so no later creation of the name can see it.
    // A creation still in flight owns its process; the teardown is rechecked once it publishes.
    std::shared_ptr<IClient> teardownLocked(const std::string& name) {
        auto client = purgeLocked(name);
        if (inflight.count(name) != 0) {
            LOG_DEBUG("Server {} is still starting; deferring its teardown", name);
            pendingTeardown.insert(name);
            return client;
        }
        launcher->Cleanup(name);
        return client;
    }

    void onServerExit(const std::string& name, std::optional<int> code, std::optional<int> signal) {
        std::shared_ptr<IClient> client;
        {
            std::lock_guard<std::mutex> lk(mutex);
            client = purgeLocked(name);
        }
        if (client) {
            LOG_WARN("Server {} left the pool after exiting (code {}, signal {})", name,
                     code.has_value() ? std::to_string(*code) : std::string("null"), SignalName(signal));
            disconnectQuietly(name, client);
        }
    }

    static async::Task<void> coCreate(std::shared_ptr<Impl> self, std::string name, ServerConfig config,
                                      uint64_t startedGeneration,
                                      std::shared_ptr<std::promise<DiscoveredServer>> promise);
};

//==========================================================================================================
// coCreate
// Purpose: Launch then discover, publishing the result to the single-flight promise.
// Notes:
//   The entry is stored only if the launcher still tracks this very process and no Reset happened in
//   between; otherwise the creation fails and everything it started is torn down. A teardown requested
//   during the creation runs right after publishing, unless a session registered the server meanwhile.
//==========================================================================================================
async::Task<void> ServerPool::Impl::coCreate(std::shared_ptr<Impl> self, std::string name, ServerConfig config,
                                             uint64_t startedGeneration,
                                             std::shared_ptr<std::promise<DiscoveredServer>> promise) {
    std::shared_ptr<ProcessHandle> process;
    std::shared_ptr<IClient> client;
    std::exception_ptr failure;
    try {
        LOG_INFO("Launching new server: {}", name);
        process = co_await async::makeFutureAwaitable(self->launcher->Launch(name, config));
        DiscoveredServer discovered = co_await async::makeFutureAwaitable(self->discovery->DiscoverCapabilities(name, process));
        client = discovered.client;
        bool published = false;
        bool released = false;
        bool reset = false;
        {
            std::lock_guard<std::mutex> lk(self->mutex);
            reset = self->generation != startedGeneration;
            if (!reset && self->launcher->GetProcess(name) == process) {
                self->inflight.erase(name);
                self->entries[name] = PoolEntry{process, discovered.client, discovered.capabilities};
                LOG_INFO("Server {} pooled with {} tools and {} resources", name,
                         discovered.capabilities.tools.size(), discovered.capabilities.resources.size());
                published = true;
                if (self->pendingTeardown.erase(name) != 0 && !self->referencedLocked(name)) {
                    LOG_INFO("Server {} was released during startup; tearing it down", name);
                    self->teardownLocked(name);
                    released = true;
                }
            }
        }
        if (published) {
            if (released) {
                disconnectQuietly(name, client);
            }
            promise->set_value(std::move(discovered));
            co_return;
        }
        if (auto st = process->GetExitStatus()) {
            throw ExitError(name, st->code, st->signal);
        }
        if (reset) {
            throw LaunchError(name, "Server pool was reset during startup");
        }
        throw LaunchError(name, "Server process was untracked during startup");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create server {}: {}", name, e.what());
        failure = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lk(self->mutex);
        auto it = self->inflight.find(name);
        if (it != self->inflight.end() && self->generation == startedGeneration) {
            self->inflight.erase(it);
            self->pendingTeardown.erase(name);
        }
        // Only tear down what this creation launched; after a Reset the name may belong to a newer one.
        if (process && self->launcher->GetProcess(name) == process) {
            self->launcher->Cleanup(name);
        }
    }
    disconnectQuietly(name, client);
    promise->set_exception(failure);
}

ServerPool::ServerPool(std::shared_ptr<IServerLauncher> launcher, std::shared_ptr<IServerDiscovery> discovery)
    : pImpl(std::make_shared<Impl>()) {
    if (!launcher || !discovery) {
        throw std::invalid_argument("ServerPool requires a launcher and a discovery");
    }
    pImpl->launcher = std::move(launcher);
    pImpl->discovery = std::move(discovery);
    std::weak_ptr<Impl> weak = pImpl;
    pImpl->launcher->SetExitHandler([weak](const std::string& name, std::optional<int> code, std::optional<int> signal) {
        if (auto self = weak.lock()) {
            self->onServerExit(name, code, signal);
        }
    });
}

ServerPool::~ServerPool() {
    pImpl->launcher->SetExitHandler(nullptr);
}

std::shared_future<DiscoveredServer> ServerPool::GetOrCreateServer(const std::string& name, const ServerConfig& config) {
    FUNC_SCOPE();
    std::shared_ptr<std::promise<DiscoveredServer>> promise;
    std::shared_future<DiscoveredServer> fut;
    uint64_t startedGeneration = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->entries.find(name);
        if (it != pImpl->entries.end()) {
            LOG_DEBUG("Reusing existing server: {}", name);
            std::promise<DiscoveredServer> ready;
            ready.set_value(DiscoveredServer{it->second.client, it->second.capabilities});
            return ready.get_future().share();
        }
        auto fit = pImpl->inflight.find(name);
        if (fit != pImpl->inflight.end()) {
            LOG_DEBUG("Joining in-flight creation of server: {}", name);
            return fit->second;
        }
        promise = std::make_shared<std::promise<DiscoveredServer>>();
        fut = promise->get_future().share();
        pImpl->inflight[name] = fut;
        startedGeneration = pImpl->generation;
    }
    // Started outside the lock: a synchronously completing launch and discovery re-enter it.
    (void)Impl::coCreate(pImpl, name, config, startedGeneration, promise);
    return fut;
}

void ServerPool::RegisterSessionServer(const std::string& sessionId, const std::string& name) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->sessionServers[sessionId].insert(name);
    pImpl->serverSessions[name].insert(sessionId);
    LOG_DEBUG("Registered session {} with server {}", sessionId, name);
}

void ServerPool::ReleaseSessionServers(const std::string& sessionId) {
    FUNC_SCOPE();
    std::vector<std::pair<std::string, std::shared_ptr<IClient>>> released;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->sessionServers.find(sessionId);
        if (it == pImpl->sessionServers.end()) {
            return;
        }
        const std::set<std::string> names = std::move(it->second);
        pImpl->sessionServers.erase(it);
        for (const auto& name : names) {
            auto sit = pImpl->serverSessions.find(name);
            if (sit == pImpl->serverSessions.end()) {
                continue;
            }
            sit->second.erase(sessionId);
            if (sit->second.empty()) {
                pImpl->serverSessions.erase(sit);
                LOG_INFO("Server {} has no sessions left; tearing it down", name);
                released.emplace_back(name, pImpl->teardownLocked(name));
            }
        }
    }
    for (const auto& [name, client] : released) {
        disconnectQuietly(name, client);
    }
    LOG_DEBUG("Released all servers for session {}", sessionId);
}

bool ServerPool::HasServer(const std::string& name) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->entries.count(name) != 0;
}

std::vector<std::string> ServerPool::GetSessionServers(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->sessionServers.find(sessionId);
    if (it == pImpl->sessionServers.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> ServerPool::GetServerSessions(const std::string& name) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->serverSessions.find(name);
    if (it == pImpl->serverSessions.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

bool ServerPool::CleanupUnusedServer(const std::string& name) {
    std::shared_ptr<IClient> client;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto sit = pImpl->serverSessions.find(name);
        if (sit != pImpl->serverSessions.end() && !sit->second.empty()) {
            LOG_DEBUG("Server {} still has {} sessions; keeping it", name, sit->second.size());
            return false;
        }
        removed = pImpl->entries.count(name) != 0 || pImpl->inflight.count(name) != 0;
        client = pImpl->teardownLocked(name);
    }
    disconnectQuietly(name, client);
    return removed;
}

std::optional<DiscoveredServer> ServerPool::GetServer(const std::string& name) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->entries.find(name);
    if (it == pImpl->entries.end()) {
        return std::nullopt;
    }
    return DiscoveredServer{it->second.client, it->second.capabilities};
}

void ServerPool::Reset() {
    FUNC_SCOPE();
    std::vector<std::pair<std::string, std::shared_ptr<IClient>>> clients;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (auto& [name, entry] : pImpl->entries) {
            clients.emplace_back(name, entry.client);
        }
        pImpl->entries.clear();
        pImpl->inflight.clear();
        pImpl->sessionServers.clear();
        pImpl->serverSessions.clear();
        pImpl->pendingTeardown.clear();
        ++pImpl->generation;
    }
    for (const auto& [name, client] : clients) {
        disconnectQuietly(name, client);
    }
    pImpl->launcher->StopAll().get();
    LOG_INFO("Server pool reset");
}

std::shared_future<DiscoveredServer> ServerPool::RestartServer(const std::string& name) {
    throw std::logic_error("RestartServer is not supported (server " + name +
                           "): whether sessions survive a restart and capabilities are rediscovered is undecided");
}

} // namespace mcphost
