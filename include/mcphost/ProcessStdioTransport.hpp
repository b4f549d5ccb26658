//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessStdioTransport.hpp
// Purpose: JSON-RPC transport over a spawned child's stdin/stdout pipes
//==========================================================================================================
#pragma once

#include "mcphost/ContentFramer.h"
#include "mcphost/Transport.h"
#include <memory>
#include <cstdint>

namespace mcphost {

//==========================================================================================================
// ProcessStdioTransport
// Purpose: Client side of the stdio protocol. Writes frames to the child's stdin and reads frames from
//          its stdout. The child's stderr is not touched (the launcher drains it).
//==========================================================================================================
class ProcessStdioTransport : public ITransport {
public:
    ProcessStdioTransport(std::string serverName, std::shared_ptr<ProcessHandle> process,
                          FramingMode framing = FramingMode::NewlineDelimited);
    virtual ~ProcessStdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader/writer/timeout loops.
    // Returns:
    //   Future that completes when loops are running. Fails when the process has no usable pipes.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the loops and fails pending requests with "Transport closed". The pipes stay open; they
    // belong to the ProcessHandle.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Configure maximum time to wait for a single request/response pair.
    // Args:
    //   timeoutMs: Timeout in milliseconds; 0 disables. Default MCPHOST_REQUEST_TIMEOUT_MS or 30000.
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    // Backpressure clamp for pending write buffers; overflow is reported and closes the transport.
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessStdioTransportFactory
// Purpose: Default IProcessTransportFactory used by ServerDiscovery.
//==========================================================================================================
class ProcessStdioTransportFactory : public IProcessTransportFactory {
public:
    explicit ProcessStdioTransportFactory(FramingMode framing = FramingMode::NewlineDelimited)
        : framing_(framing) {}

    std::unique_ptr<ITransport> CreateTransport(const std::string& serverName,
                                                std::shared_ptr<ProcessHandle> process) override;

private:
    FramingMode framing_;
};

} // namespace mcphost
