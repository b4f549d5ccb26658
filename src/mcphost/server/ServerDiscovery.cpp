//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDiscovery.cpp
// Purpose: Capability discovery state machine and capability normalization
//==========================================================================================================

#include <format>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "mcphost/ProcessStdioTransport.hpp"
#include "mcphost/async/Task.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/server/ServerDiscovery.h"
#include "mcphost/version.h"

namespace mcphost {

namespace {

std::shared_ptr<JSONValue> makeValue(JSONValue v) {
    return std::make_shared<JSONValue>(std::move(v));
}

// Object schema with "type":"object" and a "properties" object, other keys preserved.
JSONValue normalizeSchema(const JSONValue* schema) {
    JSONValue::Object out;
    if (schema) {
        if (const auto* obj = std::get_if<JSONValue::Object>(&schema->value)) {
            out = *obj;
        }
    }
    out["type"] = makeValue(JSONValue{std::string("object")});
    const JSONValue* props = FindMember(out, "properties");
    if (!props || !props->isObject()) {
        out["properties"] = makeValue(JSONValue{JSONValue::Object{}});
    }
    const JSONValue* required = FindMember(out, "required");
    if (required && !required->isArray()) {
        out.erase("required");
    }
    return JSONValue{std::move(out)};
}

std::string classify(const errors::McpException& e) {
    switch (e.code()) {
        case JSONRPCErrorCodes::ConnectionError:
            return std::format("Server connection failed: {}", e.what());
        case JSONRPCErrorCodes::ProtocolError:
            return std::format("Protocol handshake failed: {}", e.what());
        default:
            return e.what();
    }
}

} // namespace

const char* ToString(DiscoveryState state) {
    switch (state) {
        case DiscoveryState::NotStarted: return "NotStarted";
        case DiscoveryState::Starting: return "Starting";
        case DiscoveryState::Ready: return "Ready";
        case DiscoveryState::Discovering: return "Discovering";
        case DiscoveryState::Active: return "Active";
        case DiscoveryState::Error: return "Error";
    }
    return "Unknown";
}

std::optional<Tool> NormalizeTool(const JSONValue& raw) {
    const auto* obj = std::get_if<JSONValue::Object>(&raw.value);
    if (!obj) {
        return std::nullopt;
    }
    auto name = GetStringMember(*obj, "name");
    if (!name || name->empty()) {
        return std::nullopt;
    }
    Tool tool;
    tool.name = std::move(*name);
    tool.description = GetStringMember(*obj, "description");
    const JSONValue* schema = FindMember(*obj, "inputSchema");
    if (!schema) {
        schema = FindMember(*obj, "parameters");
    }
    tool.inputSchema = normalizeSchema(schema);
    return tool;
}

std::optional<Resource> NormalizeResource(const JSONValue& raw) {
    const auto* obj = std::get_if<JSONValue::Object>(&raw.value);
    if (!obj) {
        return std::nullopt;
    }
    auto uri = GetStringMember(*obj, "uri");
    if (!uri || uri->empty()) {
        return std::nullopt;
    }
    Resource res;
    res.uri = std::move(*uri);
    auto name = GetStringMember(*obj, "name");
    res.name = (name && !name->empty()) ? std::move(*name) : res.uri;
    auto type = GetStringMember(*obj, "type");
    res.type = (type && !type->empty()) ? std::move(*type) : std::string("resource");
    res.description = GetStringMember(*obj, "description");
    res.mimeType = GetStringMember(*obj, "mimeType");
    return res;
}

class ServerDiscovery::Impl {
public:
    std::shared_ptr<IProcessTransportFactory> transportFactory;
    std::shared_ptr<IClientFactory> clientFactory;
    Implementation clientInfo;

    static async::Task<DiscoveredServer> coDiscover(std::shared_ptr<Impl> self, std::string name,
                                                    std::shared_ptr<ProcessHandle> process);
    static async::Task<std::map<std::string, DiscoveredServer>> coDiscoverAll(
        std::vector<std::pair<std::string, std::future<DiscoveredServer>>> pending);
};

//==========================================================================================================
// coDiscover
// Purpose: NotStarted -> Starting -> Ready -> Discovering -> Active, or -> Error with a DiscoveryError.
// Notes:
//   - Starting: transport creation and start. Failures here are connection failures.
//   - Discovering: initialize failures other than connection loss are handshake failures; a list call
//     answered with MethodNotFound contributes nothing.
//==========================================================================================================
async::Task<DiscoveredServer> ServerDiscovery::Impl::coDiscover(std::shared_ptr<Impl> self, std::string name,
                                                                std::shared_ptr<ProcessHandle> process) {
    DiscoveryState state = DiscoveryState::NotStarted;
    auto moveTo = [&state, &name](DiscoveryState next, const std::string& details) {
        if (details.empty()) {
            LOG_INFO("Server {} discovery: {} -> {}", name, ToString(state), ToString(next));
        } else {
            LOG_INFO("Server {} discovery: {} -> {} ({})", name, ToString(state), ToString(next), details);
        }
        state = next;
    };

    std::shared_ptr<IClient> client;
    CapabilitySet capabilities;
    std::exception_ptr failure;
    std::string details;
    try {
        moveTo(DiscoveryState::Starting, "");
        if (!process) {
            throw errors::McpException(errors::makeError(JSONRPCErrorCodes::ConnectionError, "No process for server"));
        }
        if (process->HasExited()) {
            throw errors::McpException(errors::makeError(JSONRPCErrorCodes::ConnectionError, "Server process has exited"));
        }
        auto transport = self->transportFactory->CreateTransport(name, process);
        if (!transport) {
            throw errors::McpException(errors::makeError(JSONRPCErrorCodes::ConnectionError, "No transport for server"));
        }
        client = std::shared_ptr<IClient>(self->clientFactory->CreateClient());
        if (!client) {
            throw std::runtime_error("Client factory returned no client");
        }
        try {
            co_await async::makeFutureAwaitable(client->Connect(std::move(transport)));
        } catch (const errors::McpException&) {
            throw;
        } catch (const std::exception& e) {
            throw errors::McpException(errors::makeError(JSONRPCErrorCodes::ConnectionError, e.what()));
        }
        moveTo(DiscoveryState::Ready, "transport started");

        moveTo(DiscoveryState::Discovering, "initializing client");
        InitializeResult init;
        try {
            init = co_await async::makeFutureAwaitable(client->Initialize(self->clientInfo));
        } catch (const errors::McpException& e) {
            if (e.code() == JSONRPCErrorCodes::ConnectionError) {
                throw;
            }
            errors::McpError wrapped = e.error();
            wrapped.code = JSONRPCErrorCodes::ProtocolError;
            wrapped.category = errors::ErrorCategory::Protocol;
            throw errors::McpException(std::move(wrapped));
        }
        LOG_DEBUG("Server {} speaks protocol {} as {} {}", name, init.protocolVersion, init.serverInfo.name,
                  init.serverInfo.version);

        std::vector<JSONValue> rawTools;
        try {
            rawTools = co_await async::makeFutureAwaitable(client->ListTools());
        } catch (const errors::McpException& e) {
            if (e.category() != errors::ErrorCategory::JsonRpcMethodNotFound) {
                throw;
            }
            LOG_DEBUG("Server {} does not implement {}", name, Methods::ListTools);
        }
        std::vector<JSONValue> rawResources;
        try {
            rawResources = co_await async::makeFutureAwaitable(client->ListResources());
        } catch (const errors::McpException& e) {
            if (e.category() != errors::ErrorCategory::JsonRpcMethodNotFound) {
                throw;
            }
            LOG_DEBUG("Server {} does not implement {}", name, Methods::ListResources);
        }

        for (const auto& raw : rawTools) {
            if (auto tool = NormalizeTool(raw)) {
                capabilities.tools.push_back(std::move(*tool));
            } else {
                LOG_WARN("Server {}: skipping malformed tool entry {}", name, SerializeJSON(raw));
            }
        }
        for (const auto& raw : rawResources) {
            if (auto res = NormalizeResource(raw)) {
                capabilities.resources.push_back(std::move(*res));
            } else {
                LOG_WARN("Server {}: skipping malformed resource entry {}", name, SerializeJSON(raw));
            }
        }
        if (capabilities.empty()) {
            throw std::runtime_error("No capabilities discovered");
        }
        moveTo(DiscoveryState::Active, std::format("Discovered {} tools and {} resources",
                                                   capabilities.tools.size(), capabilities.resources.size()));
    } catch (const errors::McpException& e) {
        details = classify(e);
        failure = std::current_exception();
    } catch (const std::exception& e) {
        details = e.what();
        failure = std::current_exception();
    }

    if (failure) {
        moveTo(DiscoveryState::Error, details);
        if (client) {
            try {
                co_await async::makeFutureAwaitable(client->Disconnect());
            } catch (const std::exception& e) {
                LOG_WARN("Server {}: disconnect after failed discovery: {}", name, e.what());
            }
        }
        throw DiscoveryError(details, {failure}, name);
    }
    co_return DiscoveredServer{client, std::move(capabilities)};
}

async::Task<std::map<std::string, DiscoveredServer>> ServerDiscovery::Impl::coDiscoverAll(
    std::vector<std::pair<std::string, std::future<DiscoveredServer>>> pending) {
    std::map<std::string, DiscoveredServer> discovered;
    std::vector<std::exception_ptr> causes;
    for (auto& [name, fut] : pending) {
        try {
            discovered[name] = co_await async::makeFutureAwaitable(std::move(fut));
        } catch (const std::exception& e) {
            LOG_WARN("Capability discovery failed for {}: {}", name, e.what());
            causes.push_back(std::current_exception());
        }
    }
    if (!causes.empty()) {
        // The servers that did succeed are not handed out, so release their clients.
        for (auto& [name, server] : discovered) {
            if (server.client) {
                server.client->Disconnect().wait();
            }
        }
        throw DiscoveryError("One or more servers failed capability discovery", std::move(causes));
    }
    co_return discovered;
}

ServerDiscovery::ServerDiscovery()
    : ServerDiscovery(std::make_shared<ProcessStdioTransportFactory>(), std::make_shared<ClientFactory>()) {}

ServerDiscovery::ServerDiscovery(std::shared_ptr<IProcessTransportFactory> transportFactory,
                                 std::shared_ptr<IClientFactory> clientFactory)
    : ServerDiscovery(std::move(transportFactory), std::move(clientFactory),
                      Implementation(kClientName, getVersionString())) {}

ServerDiscovery::ServerDiscovery(std::shared_ptr<IProcessTransportFactory> transportFactory,
                                 std::shared_ptr<IClientFactory> clientFactory,
                                 Implementation clientInfo)
    : pImpl(std::make_shared<Impl>()) {
    if (!transportFactory || !clientFactory) {
        throw std::invalid_argument("ServerDiscovery requires a transport factory and a client factory");
    }
    pImpl->transportFactory = std::move(transportFactory);
    pImpl->clientFactory = std::move(clientFactory);
    pImpl->clientInfo = std::move(clientInfo);
}

ServerDiscovery::~ServerDiscovery() = default;

std::future<DiscoveredServer> ServerDiscovery::DiscoverCapabilities(const std::string& name,
                                                                    std::shared_ptr<ProcessHandle> process) {
    FUNC_SCOPE();
    return Impl::coDiscover(pImpl, name, std::move(process)).toFuture();
}

std::future<std::map<std::string, DiscoveredServer>> ServerDiscovery::DiscoverAllCapabilities(
    const std::map<std::string, std::shared_ptr<ProcessHandle>>& processes) {
    FUNC_SCOPE();
    std::vector<std::pair<std::string, std::future<DiscoveredServer>>> pending;
    pending.reserve(processes.size());
    for (const auto& [name, process] : processes) {
        pending.emplace_back(name, DiscoverCapabilities(name, process));
    }
    return Impl::coDiscoverAll(std::move(pending)).toFuture();
}

} // namespace mcphost
