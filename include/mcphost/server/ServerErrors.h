//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerErrors.h
// Purpose: Error hierarchy for server launch, health check, unexpected exit and capability discovery
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcphost {

//==========================================================================================================
// ServerError
// Purpose: Base for every lifecycle failure of a named server. Carries the exit code or terminating
//          signal when the failure was caused by the process going away.
//==========================================================================================================
class ServerError : public std::runtime_error {
public:
    ServerError(const std::string& message, std::string serverName,
                std::optional<int> exitCode = std::nullopt, std::optional<int> signal = std::nullopt);

    const std::string& serverName() const noexcept { return serverName_; }
    std::optional<int> exitCode() const noexcept { return exitCode_; }
    std::optional<int> signal() const noexcept { return signal_; }

private:
    std::string serverName_;
    std::optional<int> exitCode_;
    std::optional<int> signal_;
};

// "Failed to launch server <name>: <detail>"
class LaunchError : public ServerError {
public:
    LaunchError(const std::string& serverName, const std::string& detail);
};

// "Server <name> health check failed: <detail>"
class HealthError : public ServerError {
public:
    HealthError(const std::string& serverName, const std::string& detail);
};

// "Server <name> exited with code <c> (signal: <SIG>)"; missing parts print as null.
class ExitError : public ServerError {
public:
    ExitError(const std::string& serverName, std::optional<int> exitCode, std::optional<int> signal);
};

//==========================================================================================================
// DiscoveryError
// Purpose: Capability discovery failure. A single-server failure carries the server name and the
//          underlying exception; the aggregate failure of a multi-server discovery carries one cause
//          per failed server.
//==========================================================================================================
class DiscoveryError : public std::runtime_error {
public:
    DiscoveryError(const std::string& message, std::vector<std::exception_ptr> causes,
                   std::optional<std::string> serverName = std::nullopt);

    const std::vector<std::exception_ptr>& causes() const noexcept { return causes_; }
    const std::optional<std::string>& serverName() const noexcept { return serverName_; }

private:
    std::vector<std::exception_ptr> causes_;
    std::optional<std::string> serverName_;
};

// what() of a stored std::exception. Exceptions of other types propagate.
std::string DescribeException(const std::exception_ptr& ep);

} // namespace mcphost
