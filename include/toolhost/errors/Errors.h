//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed exceptions for tool-server lifecycle failures and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Categorization of the standard JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed form of a JSON-RPC error object returned by a tool server.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric JSON-RPC error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped (server-defined codes).
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* codeVal = errVal.find("code");
    const JSONValue* msgVal = errVal.find("message");
    if (!codeVal || !msgVal) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(codeVal->value) || !msgVal->isString()) {
        return std::nullopt;
    }

    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(codeVal->value));
    e.message = std::get<std::string>(msgVal->value);
    if (const JSONValue* dataVal = errVal.find("data")) {
        e.data = *dataVal;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
//
// Notes:
//   A malformed error object still yields an InternalError-coded McpError so callers never
//   mistake an error response for success.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    auto typed = mcpErrorFromErrorValue(response.error.value());
    if (typed.has_value()) {
        return typed;
    }
    McpError e;
    e.code = JSONRPCErrorCodes::InternalError;
    e.message = "Malformed error object: " + SerializeJSON(response.error.value());
    e.category = ErrorCategory::JsonRpcInternal;
    return e;
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

//==========================================================================================================
// ErrorKind
// Purpose: Discriminates the failure classes surfaced by the client to its callers.
//==========================================================================================================
enum class ErrorKind {
    Spawn,
    InitializationTimeout,
    DiscoveryTimeout,
    Handshake,
    BrokenPipe,
    Timeout,
    UnknownServer,
    ServerNotReady,
    ToolCall,
    Configuration
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Spawn: return "Spawn";
        case ErrorKind::InitializationTimeout: return "InitializationTimeout";
        case ErrorKind::DiscoveryTimeout: return "DiscoveryTimeout";
        case ErrorKind::Handshake: return "Handshake";
        case ErrorKind::BrokenPipe: return "BrokenPipe";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::UnknownServer: return "UnknownServer";
        case ErrorKind::ServerNotReady: return "ServerNotReady";
        case ErrorKind::ToolCall: return "ToolCall";
        case ErrorKind::Configuration: return "Configuration";
    }
    return "Unknown";
}

//==========================================================================================================
// ToolHostError
// Purpose: Base of every exception raised by the client. what() carries a human-readable reason.
//==========================================================================================================
class ToolHostError : public std::runtime_error {
public:
    ToolHostError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// The child process could not be started (missing executable, bad cwd, fork failure).
class SpawnError : public ToolHostError {
public:
    explicit SpawnError(const std::string& message) : ToolHostError(ErrorKind::Spawn, message) {}
};

// No initialize response arrived within the init timeout.
class InitializationTimeoutError : public ToolHostError {
public:
    explicit InitializationTimeoutError(const std::string& message)
        : ToolHostError(ErrorKind::InitializationTimeout, message) {}
};

// No tools/list response arrived within the request timeout.
class DiscoveryTimeoutError : public ToolHostError {
public:
    explicit DiscoveryTimeoutError(const std::string& message)
        : ToolHostError(ErrorKind::DiscoveryTimeout, message) {}
};

// initialize or tools/list answered with an error or an unusable result.
class HandshakeError : public ToolHostError {
public:
    explicit HandshakeError(const std::string& message) : ToolHostError(ErrorKind::Handshake, message) {}
};

// Writing to the child failed or the child exited while a request was outstanding.
class BrokenPipeError : public ToolHostError {
public:
    explicit BrokenPipeError(const std::string& message) : ToolHostError(ErrorKind::BrokenPipe, message) {}
};

// A request received no response within its timeout.
class RequestTimeoutError : public ToolHostError {
public:
    explicit RequestTimeoutError(const std::string& message) : ToolHostError(ErrorKind::Timeout, message) {}
};

class UnknownServerError : public ToolHostError {
public:
    explicit UnknownServerError(const std::string& serverId)
        : ToolHostError(ErrorKind::UnknownServer, "Unknown server id: " + serverId), serverId_(serverId) {}

    const std::string& serverId() const noexcept { return serverId_; }

private:
    std::string serverId_;
};

class ServerNotReadyError : public ToolHostError {
public:
    explicit ServerNotReadyError(const std::string& message)
        : ToolHostError(ErrorKind::ServerNotReady, message) {}
};

//==========================================================================================================
// ToolCallError
// Purpose: The server answered tools/call with a JSON-RPC error; carries the typed error object.
//==========================================================================================================
class ToolCallError : public ToolHostError {
public:
    explicit ToolCallError(McpError error)
        : ToolHostError(ErrorKind::ToolCall,
                        "Tool call failed (" + std::to_string(error.code) + "): " + error.message),
          error_(std::move(error)) {}

    const McpError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }

private:
    McpError error_;
};

// A configuration template, file or override could not be used.
class ConfigurationError : public ToolHostError {
public:
    explicit ConfigurationError(const std::string& message)
        : ToolHostError(ErrorKind::Configuration, message) {}
};

} // namespace errors
} // namespace toolhost
