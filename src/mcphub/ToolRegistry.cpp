//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registry and schema builders
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "mcphub/ToolRegistry.h"
#include "mcphub/errors/Errors.h"

namespace mcphub {

void ToolRegistry::RegisterTool(const Tool& tool, ToolHandler handler) {
    FUNC_SCOPE();
    if (tool.name.empty()) {
        throw std::invalid_argument("ToolRegistry: tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("ToolRegistry: handler for '" + tool.name + "' is empty");
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto [it, inserted] = entries.insert_or_assign(tool.name, Entry{tool, std::move(handler)});
    (void)it;
    if (inserted) {
        order.push_back(tool.name);
        LOG_INFO("Registered tool: {}", tool.name);
    } else {
        LOG_INFO("Replaced tool: {}", tool.name);
    }
}

bool ToolRegistry::UnregisterTool(const std::string& name) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex);
    if (entries.erase(name) == 0) {
        return false;
    }
    order.erase(std::remove(order.begin(), order.end(), name), order.end());
    LOG_DEBUG("Unregistered tool: {}", name);
    return true;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.count(name) > 0;
}

std::vector<Tool> ToolRegistry::ListTools() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<Tool> out;
    out.reserve(order.size());
    for (const auto& name : order) {
        out.push_back(entries.at(name).tool);
    }
    return out;
}

std::optional<Tool> ToolRegistry::GetTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(name);
    if (it == entries.end()) {
        return std::nullopt;
    }
    return it->second.tool;
}

std::future<ToolResult> ToolRegistry::CallTool(const std::string& name, const JSONValue& arguments,
                                               std::stop_token stop) const {
    FUNC_SCOPE();
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(name);
        if (it != entries.end()) {
            handler = it->second.handler;
        }
    }
    if (!handler) {
        throw errors::McpException(JSONRPCErrorCodes::ToolNotFound, "Tool not found: " + name);
    }
    LOG_DEBUG("Calling tool: {}", name);
    return handler(arguments, stop);
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

///////////////////////////////////////////// Schema builders /////////////////////////////////////////////
namespace schema {

namespace {

JSONValue typed(const char* type, const std::string& description) {
    JSONValue::Object o;
    SetMember(o, "type", JSONValue(type));
    SetMember(o, "description", JSONValue(description));
    return JSONValue{std::move(o)};
}

JSONValue stringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue{std::move(arr)};
}

} // namespace

JSONValue StringParameter(const std::string& description) {
    return typed("string", description);
}

JSONValue NumberParameter(const std::string& description, std::optional<double> minimum,
                          std::optional<double> maximum) {
    JSONValue v = typed("number", description);
    auto& o = std::get<JSONValue::Object>(v.value);
    if (minimum.has_value()) {
        SetMember(o, "minimum", JSONValue(minimum.value()));
    }
    if (maximum.has_value()) {
        SetMember(o, "maximum", JSONValue(maximum.value()));
    }
    return v;
}

JSONValue BooleanParameter(const std::string& description) {
    return typed("boolean", description);
}

JSONValue ObjectParameter(const std::string& description, JSONValue::Object properties,
                          const std::vector<std::string>& required) {
    JSONValue v = typed("object", description);
    auto& o = std::get<JSONValue::Object>(v.value);
    SetMember(o, "properties", JSONValue{std::move(properties)});
    if (!required.empty()) {
        SetMember(o, "required", stringArray(required));
    }
    return v;
}

JSONValue ArrayParameter(const std::string& description, JSONValue items) {
    JSONValue v = typed("array", description);
    SetMember(std::get<JSONValue::Object>(v.value), "items", std::move(items));
    return v;
}

JSONValue ToolSchema(const std::string& description, JSONValue::Object properties,
                     const std::vector<std::string>& required) {
    JSONValue v = typed("object", description);
    auto& o = std::get<JSONValue::Object>(v.value);
    SetMember(o, "properties", JSONValue{std::move(properties)});
    SetMember(o, "required", stringArray(required));
    return v;
}

} // namespace schema

} // namespace mcphub
