//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Multi-server client - named connections, aggregate capability indices, correlated calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphub/Config.h"
#include "mcphub/Connection.h"
#include "mcphub/Protocol.h"
#include "mcphub/Transport.h"

namespace mcphub {

// Discovered descriptors paired with the server that owns them.
struct ServerTool {
    std::string server;
    Tool tool;
};

struct ServerResource {
    std::string server;
    Resource resource;
};

struct ServerPrompt {
    std::string server;
    Prompt prompt;
};

//==========================================================================================================
// Client interface
// Purpose: Connects to any number of named servers and routes calls to whichever one owns an item.
// Notes:
//   - Items are indexed by (server, item). When two servers expose the same item name, the one
//     registered first receives the calls.
//   - A timeout of std::nullopt uses the owning connection's configured request timeout.
//   - Failures are delivered as errors::McpException through the returned futures.
//==========================================================================================================
class IClient {
public:
    using NotificationHandler = Connection::NotificationHandler;

    virtual ~IClient() = default;

    /////////////////////////////////////////// Connection management //////////////////////////////////////////
    //==========================================================================================================
    // Connects a server and runs handshake and discovery. Reconnecting under an existing name first tears
    // down the old connection.
    // Args:
    //   name:   Server name used in item keys ("name:item").
    //   config: How to reach the server.
    // Returns:
    //   A future that completes when the server is Ready, or fails with ConnectFailed.
    //==========================================================================================================
    virtual std::future<void> ConnectServer(const std::string& name, const ServerConfig& config) = 0;

    // Same as above over an already constructed (not yet started) transport.
    virtual std::future<void> ConnectServer(const std::string& name, std::unique_ptr<ITransport> transport) = 0;

    // Tears down one server; its outstanding calls fail with ConnectionClosed and its items are purged.
    virtual std::future<void> DisconnectServer(const std::string& name) = 0;

    // Tears down every server. Safe to call repeatedly.
    virtual std::future<void> Shutdown() = 0;

    /////////////////////////////////////////// Invocation //////////////////////////////////////////
    //==========================================================================================================
    // Calls a tool on the server that advertised it.
    // Args:
    //   toolName:  Bare tool name as advertised by the server.
    //   arguments: Argument object.
    //   timeout:   Maximum wait for the response.
    // Returns:
    //   Future of the tool result. Fails with ToolNotFound (nothing is sent), Timeout, ConnectionClosed,
    //   TransportClosed, or the server's error.
    //==========================================================================================================
    virtual std::future<ToolResult> CallTool(const std::string& toolName, const JSONValue& arguments,
                                             std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    virtual std::future<ReadResourceResult> ReadResource(const std::string& uri,
                                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    virtual std::future<GetPromptResult> GetPrompt(const std::string& name, const JSONValue& arguments,
                                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    // Round-trips a ping to one server.
    virtual std::future<void> Ping(const std::string& server,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    /////////////////////////////////////////// Snapshots //////////////////////////////////////////
    virtual std::vector<std::string> ListConnectedServers() const = 0;
    // "server:tool" keys, in registration order.
    virtual std::vector<std::string> ListTools() const = 0;
    // "server:uri" keys.
    virtual std::vector<std::string> ListResources() const = 0;
    // "server:prompt" keys.
    virtual std::vector<std::string> ListPrompts() const = 0;

    virtual std::vector<ServerTool> GetAvailableTools() const = 0;
    virtual std::vector<ServerResource> GetAvailableResources() const = 0;
    virtual std::vector<ServerPrompt> GetAvailablePrompts() const = 0;

    virtual std::optional<ConnectionState> GetServerState(const std::string& name) const = 0;

    /////////////////////////////////////////// Notifications //////////////////////////////////////////
    // Installs a handler on every current and future connection. An empty handler removes it.
    virtual void SetNotificationHandler(const std::string& method, NotificationHandler handler) = 0;
};

// Standard client implementation
class Client : public IClient {
public:
    explicit Client(const Implementation& clientInfo, const ClientCapabilities& capabilities = ClientCapabilities{});
    ~Client() override;

    ////////////////////////////////////////// IClient implementation //////////////////////////////////////////
    std::future<void> ConnectServer(const std::string& name, const ServerConfig& config) override;
    std::future<void> ConnectServer(const std::string& name, std::unique_ptr<ITransport> transport) override;
    std::future<void> DisconnectServer(const std::string& name) override;
    std::future<void> Shutdown() override;

    std::future<ToolResult> CallTool(const std::string& toolName, const JSONValue& arguments,
                                     std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    std::future<ReadResourceResult> ReadResource(const std::string& uri,
                                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    std::future<GetPromptResult> GetPrompt(const std::string& name, const JSONValue& arguments,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    std::future<void> Ping(const std::string& server,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;

    std::vector<std::string> ListConnectedServers() const override;
    std::vector<std::string> ListTools() const override;
    std::vector<std::string> ListResources() const override;
    std::vector<std::string> ListPrompts() const override;
    std::vector<ServerTool> GetAvailableTools() const override;
    std::vector<ServerResource> GetAvailableResources() const override;
    std::vector<ServerPrompt> GetAvailablePrompts() const override;
    std::optional<ConnectionState> GetServerState(const std::string& name) const override;

    void SetNotificationHandler(const std::string& method, NotificationHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Client factory interface
class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<IClient> CreateClient(const Implementation& clientInfo) = 0;
};

// Standard client factory
class ClientFactory : public IClientFactory {
public:
    std::unique_ptr<IClient> CreateClient(const Implementation& clientInfo) override;
};

} // namespace mcphub
