//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces for talking JSON-RPC to a tool server
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace mcphost {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;
struct ProcessHandle;

//==========================================================================================================
// ITransport
// Purpose: One bidirectional JSON-RPC session with a peer.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Pending requests fail with a connection error.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Unique pointer to a JSONRPCRequest to send.
    // Returns:
    //   Future resolving to a unique_ptr<JSONRPCResponse>. Transport failures (timeout, closed peer)
    //   are encoded as error responses, never thrown.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    // Returns:
    //   Future completing when the notification has been written to the transport.
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Server-initiated requests. The returned response is sent back to the peer.
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// IProcessTransportFactory
// Purpose: Builds a transport bound to an already spawned child's stdin/stdout pipes.
//==========================================================================================================
class IProcessTransportFactory {
public:
    virtual ~IProcessTransportFactory() = default;

    //==========================================================================================================
    // Creates a transport for the process.
    // Args:
    //   serverName: Name used for logging and the session id.
    //   process: Handle owned by the launcher; the transport keeps a shared reference to it.
    // Returns:
    //   A unique_ptr to a newly created, not yet started ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& serverName,
                                                        std::shared_ptr<ProcessHandle> process) = 0;
};

} // namespace mcphost
