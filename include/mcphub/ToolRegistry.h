//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Pluggable name -> handler registry consulted by the server for tools/call
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcphub/Protocol.h"

namespace mcphub {

// Async, cancellable tool handler. Failures are reported by throwing (directly or through the future).
using ToolHandler = std::function<std::future<ToolResult>(const JSONValue& arguments, std::stop_token)>;

//==========================================================================================================
// ToolRegistry
// Purpose: Holds tool metadata and handlers. Instances are created by the embedding program and
//          injected into a Server; one registry may be shared by several servers.
// Notes:
//   Registering an existing name replaces its metadata and handler. Listing preserves registration order.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void RegisterTool(const Tool& tool, ToolHandler handler);
    bool UnregisterTool(const std::string& name);
    bool HasTool(const std::string& name) const;
    std::vector<Tool> ListTools() const;
    std::optional<Tool> GetTool(const std::string& name) const;

    //==========================================================================================================
    // CallTool
    // Purpose: Invokes the handler registered under name.
    // Args:
    //   name:      Tool name.
    //   arguments: Argument object passed through unchanged.
    //   stop:      Cancellation token forwarded to the handler.
    // Returns:
    //   The handler's future.
    // Throws:
    //   errors::McpException (ToolNotFound) for unknown names; anything the handler throws synchronously.
    //==========================================================================================================
    std::future<ToolResult> CallTool(const std::string& name, const JSONValue& arguments,
                                     std::stop_token stop = {}) const;

    std::size_t Size() const;

private:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };
    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    std::vector<std::string> order;
};

//==========================================================================================================
// schema
// Purpose: Builders for the JSON Schema fragments used as Tool::inputSchema.
//==========================================================================================================
namespace schema {
JSONValue StringParameter(const std::string& description);
JSONValue NumberParameter(const std::string& description, std::optional<double> minimum = std::nullopt,
                          std::optional<double> maximum = std::nullopt);
JSONValue BooleanParameter(const std::string& description);
JSONValue ObjectParameter(const std::string& description, JSONValue::Object properties,
                          const std::vector<std::string>& required = {});
JSONValue ArrayParameter(const std::string& description, JSONValue items);

// Complete input schema: { type: object, description, properties, required: [...] }.
JSONValue ToolSchema(const std::string& description, JSONValue::Object properties,
                     const std::vector<std::string>& required = {});
} // namespace schema

} // namespace mcphub
