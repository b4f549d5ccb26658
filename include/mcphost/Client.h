//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Protocol client used to talk to one tool server over an ITransport
//==========================================================================================================

#pragma once

#include "Transport.h"
#include "JSONRPCTypes.h"
#include "Protocol.h"
#include <memory>
#include <string>
#include <vector>
#include <future>
#include <functional>

namespace mcphost {

//==========================================================================================================
// IClient
// Purpose: Client side of the tool server protocol. Every future fails with errors::McpException when the
//          server answers with an error object or the transport reports a failure.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Establishes a connection to the server over the provided transport.
    // Args:
    //   transport: The transport implementation to use (takes ownership). Started by this call.
    // Returns:
    //   A future that completes when the transport has started and the client wiring is ready.
    //==========================================================================================================
    virtual std::future<void> Connect(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Closes the active transport connection if present. Never fails.
    //==========================================================================================================
    virtual std::future<void> Disconnect() = 0;

    virtual bool IsConnected() const = 0;

    ////////////////////////////////////////// Protocol initialization /////////////////////////////////////////
    //==========================================================================================================
    // Performs the initialize handshake and then sends notifications/initialized.
    // Args:
    //   clientInfo: Implementation info (name and version) for this client.
    // Returns:
    //   A future resolving to the server's initialize result.
    //==========================================================================================================
    virtual std::future<InitializeResult> Initialize(const Implementation& clientInfo) = 0;

    ////////////////////////////////////////// Listings /////////////////////////////////////////////////
    //==========================================================================================================
    // Lists one page of tools.
    // Args:
    //   cursor: Opaque cursor from a previous page's nextCursor; nullopt for the first page.
    // Returns:
    //   A future with the raw tool objects and the next cursor, if any.
    //==========================================================================================================
    virtual std::future<ListPage> ListToolsPage(const std::optional<std::string>& cursor) = 0;

    // Follows nextCursor until exhausted and returns every raw tool object.
    virtual std::future<std::vector<JSONValue>> ListTools() = 0;

    virtual std::future<ListPage> ListResourcesPage(const std::optional<std::string>& cursor) = 0;

    // Follows nextCursor until exhausted and returns every raw resource object.
    virtual std::future<std::vector<JSONValue>> ListResources() = 0;

    ////////////////////////////////////////// Invocation /////////////////////////////////////////////////
    //==========================================================================================================
    // Invokes a server tool by name. The payload is forwarded untouched.
    // Args:
    //   name: The tool name.
    //   arguments: JSON object containing the tool parameters.
    // Returns:
    //   A future with the raw result object.
    //==========================================================================================================
    virtual std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments) = 0;

    virtual std::future<JSONValue> ReadResource(const std::string& uri) = 0;

    virtual std::future<void> Ping() = 0;

    ////////////////////////////////////////// Handlers /////////////////////////////////////////////////
    using NotificationHandler = std::function<void(const std::string& method, const JSONValue& params)>;
    virtual void SetNotificationHandler(const std::string& method, NotificationHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

// Standard client implementation
class Client : public IClient {
public:
    Client();
    virtual ~Client();

    std::future<void> Connect(std::unique_ptr<ITransport> transport) override;
    std::future<void> Disconnect() override;
    bool IsConnected() const override;

    std::future<InitializeResult> Initialize(const Implementation& clientInfo) override;

    std::future<ListPage> ListToolsPage(const std::optional<std::string>& cursor) override;
    std::future<std::vector<JSONValue>> ListTools() override;
    std::future<ListPage> ListResourcesPage(const std::optional<std::string>& cursor) override;
    std::future<std::vector<JSONValue>> ListResources() override;

    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments) override;
    std::future<JSONValue> ReadResource(const std::string& uri) override;
    std::future<void> Ping() override;

    void SetNotificationHandler(const std::string& method, NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Client factory interface
class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<IClient> CreateClient() = 0;
};

// Standard client factory
class ClientFactory : public IClientFactory {
public:
    std::unique_ptr<IClient> CreateClient() override;
};

} // namespace mcphost
