//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerErrors.cpp
// Purpose: Message formatting for the server error hierarchy
//==========================================================================================================

#include <format>

#include "mcphost/server/ProcessHandle.h"
#include "mcphost/server/ServerErrors.h"

namespace mcphost {

namespace {

std::string formatExit(const std::string& serverName, std::optional<int> exitCode, std::optional<int> signal) {
    const std::string code = exitCode.has_value() ? std::to_string(*exitCode) : std::string("null");
    return std::format("Server {} exited with code {} (signal: {})", serverName, code, SignalName(signal));
}

} // namespace

ServerError::ServerError(const std::string& message, std::string serverName,
                         std::optional<int> exitCode, std::optional<int> signal)
    : std::runtime_error(message), serverName_(std::move(serverName)), exitCode_(exitCode), signal_(signal) {}

LaunchError::LaunchError(const std::string& serverName, const std::string& detail)
    : ServerError(std::format("Failed to launch server {}: {}", serverName, detail), serverName) {}

HealthError::HealthError(const std::string& serverName, const std::string& detail)
    : ServerError(std::format("Server {} health check failed: {}", serverName, detail), serverName) {}

ExitError::ExitError(const std::string& serverName, std::optional<int> exitCode, std::optional<int> signal)
    : ServerError(formatExit(serverName, exitCode, signal), serverName, exitCode, signal) {}

DiscoveryError::DiscoveryError(const std::string& message, std::vector<std::exception_ptr> causes,
                               std::optional<std::string> serverName)
    : std::runtime_error(message), causes_(std::move(causes)), serverName_(std::move(serverName)) {}

std::string DescribeException(const std::exception_ptr& ep) {
    if (!ep) {
        return "no exception";
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "unknown exception";
}

} // namespace mcphost
