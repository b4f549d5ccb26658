//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed protocol errors, JSON-RPC error mapping helpers and the exception the client raises
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// Categorization of common JSON-RPC codes and the transport codes raised locally.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Connection,
    Protocol,
    Timeout,
    Unknown
};

// Typed error representation carried by McpException.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ConnectionError: return ErrorCategory::Connection;
        case JSONRPCErrorCodes::ProtocolError: return ErrorCategory::Protocol;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::Timeout;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const auto* obj = std::get_if<JSONValue::Object>(&errVal.value);
    if (!obj) {
        return std::nullopt;
    }
    auto code = GetIntMember(*obj, "code");
    auto message = GetStringMember(*obj, "message");
    if (!code || !message) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(*code);
    e.message = std::move(*message);
    if (const JSONValue* d = FindMember(*obj, "data")) {
        e.data = *d;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

inline McpError makeError(int code, std::string message) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.category = errorCategoryFromCode(code);
    return e;
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying a typed McpError. Thrown through futures by the protocol client.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const McpError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }
    ErrorCategory category() const noexcept { return error_.category; }

private:
    McpError error_;
};

// Throws McpException when the response carries an error object. A malformed error object is reported
// as InternalError with the raw payload attached as data.
inline void throwIfError(const JSONRPCResponse& response) {
    if (!response.IsError()) {
        return;
    }
    if (auto typed = mcpErrorFromResponse(response)) {
        throw McpException(std::move(*typed));
    }
    McpError e = makeError(JSONRPCErrorCodes::InternalError, "Malformed error response");
    e.data = response.error;
    throw McpException(std::move(e));
}

} // namespace errors
} // namespace mcphost
