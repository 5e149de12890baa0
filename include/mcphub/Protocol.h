//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures, method names and JSON conversions
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcphub {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates logging notifications are supported
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
};

struct ClientCapabilities {
    bool roots = false;
    bool sampling = false;
};

///////////////////////////////////////// Content ///////////////////////////////////////////
// One content item of a tool result or prompt message ({ type, text | data+mimeType | uri }).
struct Content {
    std::string type = "text";
    std::string text;
    std::optional<std::string> mimeType;
    std::optional<std::string> data;
    std::optional<std::string> uri;

    static Content Text(std::string text) {
        Content c;
        c.text = std::move(text);
        return c;
    }
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{JSONValue::Object{}})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<Content> content;
    bool isError = false;
};

using ToolResult = CallToolResult;

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ResourceContents {
    std::string uri;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    Prompt() = default;
    Prompt(std::string name, std::string description,
           std::vector<PromptArgument> arguments = {})
        : name(std::move(name)), description(std::move(description)),
          arguments(std::move(arguments)) {}
};

struct PromptMessage {
    std::string role;
    Content content;
};

struct GetPromptResult {
    std::string description;
    std::vector<PromptMessage> messages;
};

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "initialized";
    constexpr const char* InitializedNotification = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* Progress = "progress";
    constexpr const char* ProgressNotification = "notifications/progress";
}

///////////////////////////////////////// JSON conversions ///////////////////////////////////////////
// To*: always succeed. *FromJSON: return std::nullopt when required members are missing or mistyped.
JSONValue ImplementationToJSON(const Implementation& impl);
std::optional<Implementation> ImplementationFromJSON(const JSONValue& v);

JSONValue ServerCapabilitiesToJSON(const ServerCapabilities& caps);
ServerCapabilities ServerCapabilitiesFromJSON(const JSONValue& v);
JSONValue ClientCapabilitiesToJSON(const ClientCapabilities& caps);

JSONValue ContentToJSON(const Content& c);
std::optional<Content> ContentFromJSON(const JSONValue& v);

JSONValue ToolToJSON(const Tool& tool);
std::optional<Tool> ToolFromJSON(const JSONValue& v);
JSONValue CallToolResultToJSON(const CallToolResult& r);
std::optional<CallToolResult> CallToolResultFromJSON(const JSONValue& v);

JSONValue ResourceToJSON(const Resource& r);
std::optional<Resource> ResourceFromJSON(const JSONValue& v);
JSONValue ReadResourceResultToJSON(const ReadResourceResult& r);
std::optional<ReadResourceResult> ReadResourceResultFromJSON(const JSONValue& v);

JSONValue PromptToJSON(const Prompt& p);
std::optional<Prompt> PromptFromJSON(const JSONValue& v);
JSONValue GetPromptResultToJSON(const GetPromptResult& r);
std::optional<GetPromptResult> GetPromptResultFromJSON(const JSONValue& v);

// Collects the text of every text content item, in order.
std::vector<std::string> CollectText(const CallToolResult& r);

} // namespace mcphub
