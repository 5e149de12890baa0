//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exception wrapper and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphub/JSONRPCTypes.h"

namespace mcphub {
namespace errors {

// Categorization of JSON-RPC, domain and client-local error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ToolNotFound,
    ResourceNotFound,
    PromptNotFound,
    CapabilityNotSupported,
    ConnectionClosed,
    Timeout,
    TransportClosed,
    ConnectFailed,
    Unknown
};

// Typed error representation used throughout the library.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

inline bool operator==(const McpError& a, const McpError& b) {
    return a.code == b.code && a.message == b.message && a.data == b.data;
}
inline bool operator!=(const McpError& a, const McpError& b) { return !(a == b); }

// Map a numeric error code to an ErrorCategory.
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
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::PromptNotFound;
        case JSONRPCErrorCodes::CapabilityNotSupported: return ErrorCategory::CapabilityNotSupported;
        case JSONRPCErrorCodes::ConnectionClosed: return ErrorCategory::ConnectionClosed;
        case JSONRPCErrorCodes::Timeout: return ErrorCategory::Timeout;
        case JSONRPCErrorCodes::TransportClosed: return ErrorCategory::TransportClosed;
        case JSONRPCErrorCodes::ConnectFailed: return ErrorCategory::ConnectFailed;
        default: return ErrorCategory::Unknown;
    }
}

// Short, stable name for logs and diagnostics.
inline const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::JsonRpcParse: return "ParseError";
        case ErrorCategory::JsonRpcInvalidRequest: return "InvalidRequest";
        case ErrorCategory::JsonRpcMethodNotFound: return "MethodNotFound";
        case ErrorCategory::JsonRpcInvalidParams: return "InvalidParams";
        case ErrorCategory::JsonRpcInternal: return "InternalError";
        case ErrorCategory::ToolNotFound: return "ToolNotFound";
        case ErrorCategory::ResourceNotFound: return "ResourceNotFound";
        case ErrorCategory::PromptNotFound: return "PromptNotFound";
        case ErrorCategory::CapabilityNotSupported: return "CapabilityNotSupported";
        case ErrorCategory::ConnectionClosed: return "ConnectionClosed";
        case ErrorCategory::Timeout: return "Timeout";
        case ErrorCategory::TransportClosed: return "TransportClosed";
        case ErrorCategory::ConnectFailed: return "ConnectFailed";
        case ErrorCategory::Unknown: break;
    }
    return "Unknown";
}

// Build an McpError with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        data = *d;
    }
    return makeError(static_cast<int>(code.value()), std::move(message.value()), std::move(data));
}

// Create a JSONValue error object from a typed McpError.
//
// Args:
//   err: The McpError to serialize.
//
// Returns:
//   JSONValue of Object type with code/message and optional data.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying a typed McpError; delivered through std::future::get() and thrown by
//          synchronous APIs.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : McpException(makeError(code, message, std::move(data))) {}

    const McpError& error() const noexcept { return error_; }
    ErrorCategory category() const noexcept { return error_.category; }
    int code() const noexcept { return error_.code; }

private:
    McpError error_;
};

} // namespace errors
} // namespace mcphub
