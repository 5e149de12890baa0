//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Server-side dispatcher: handshake gate, built-in methods and the pluggable tool registry
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcphub/Envelope.h"
#include "mcphub/Protocol.h"
#include "mcphub/ToolRegistry.h"
#include "mcphub/Transport.h"

namespace mcphub {

// Async, cancellable resource reader and synchronous prompt renderer.
using ResourceHandler = std::function<std::future<ReadResourceResult>(const std::string& uri, std::stop_token)>;
using PromptHandler = std::function<GetPromptResult(const JSONValue& arguments)>;

// The fixed set of methods the dispatcher serves itself.
enum class BuiltinMethod {
    Initialize,
    ListTools,
    CallTool,
    ListResources,
    ReadResource,
    ListPrompts,
    GetPrompt,
    Ping
};

std::optional<BuiltinMethod> ParseBuiltinMethod(const std::string& method);

//==========================================================================================================
// Server interface
// Purpose: Serves one peer over one transport.
//==========================================================================================================
class IServer {
public:
    virtual ~IServer() = default;

    /////////////////////////////////////////// Connection management //////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport and the receive loop.
    // Args:
    //   transport: Transport to own and serve.
    // Returns:
    //   A future that completes once the loop is running, or holds the transport's start failure.
    //==========================================================================================================
    virtual std::future<void> Start(std::unique_ptr<ITransport> transport) = 0;

    //==========================================================================================================
    // Closes the transport, cancels in-flight handlers through their stop_token and waits for them.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    // Blocks until the peer closes the stream or Stop() is called.
    virtual void Wait() = 0;

    virtual bool IsRunning() const = 0;

    // True once the `initialized` notification has been received.
    virtual bool IsInitialized() const = 0;

    /////////////////////////////////////////// Registration //////////////////////////////////////////
    virtual std::shared_ptr<ToolRegistry> GetToolRegistry() const = 0;

    virtual void RegisterResource(const Resource& resource, ResourceHandler handler) = 0;
    virtual void UnregisterResource(const std::string& uri) = 0;
    virtual std::vector<Resource> ListResources() const = 0;

    virtual void RegisterPrompt(const Prompt& prompt, PromptHandler handler) = 0;
    virtual void UnregisterPrompt(const std::string& name) = 0;
    virtual std::vector<Prompt> ListPrompts() const = 0;

    /////////////////////////////////////////// Capabilities //////////////////////////////////////////
    //==========================================================================================================
    // Sets capabilities to advertise regardless of registrations (e.g. logging, or tools before any tool
    // is registered). Categories with registered entries are always advertised.
    //==========================================================================================================
    virtual void SetCapabilities(const ServerCapabilities& capabilities) = 0;
    virtual ServerCapabilities GetCapabilities() const = 0;

    /////////////////////////////////////////// Messaging //////////////////////////////////////////
    //==========================================================================================================
    // Sends a server-originated notification (e.g. notifications/progress).
    // Throws:
    //   errors::McpException (TransportClosed) when not running or the write fails.
    //==========================================================================================================
    virtual void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt) = 0;

    //==========================================================================================================
    // Dispatches one inbound envelope on the calling thread.
    // Returns:
    //   The response for requests; std::nullopt for notifications and stray responses.
    //==========================================================================================================
    virtual std::optional<Envelope> HandleEnvelope(const Envelope& envelope) = 0;
};

//==========================================================================================================
// Server
// Purpose: Default dispatcher.
// Notes:
//   - Uninitialized: only `initialize` is served; other requests get InvalidRequest.
//   - `initialized` (or `notifications/initialized`) moves to Initialized.
//   - Requests run off the receive loop so a slow handler never blocks ping or other calls.
//   - Handler exceptions become InternalError with the exception message in error.data; McpExceptions
//     keep their own code.
//==========================================================================================================
class Server : public IServer {
public:
    explicit Server(const Implementation& serverInfo, std::shared_ptr<ToolRegistry> registry = nullptr);
    ~Server() override;

    std::future<void> Start(std::unique_ptr<ITransport> transport) override;
    std::future<void> Stop() override;
    void Wait() override;
    bool IsRunning() const override;
    bool IsInitialized() const override;

    std::shared_ptr<ToolRegistry> GetToolRegistry() const override;
    void RegisterResource(const Resource& resource, ResourceHandler handler) override;
    void UnregisterResource(const std::string& uri) override;
    std::vector<Resource> ListResources() const override;
    void RegisterPrompt(const Prompt& prompt, PromptHandler handler) override;
    void UnregisterPrompt(const std::string& name) override;
    std::vector<Prompt> ListPrompts() const override;

    void SetCapabilities(const ServerCapabilities& capabilities) override;
    ServerCapabilities GetCapabilities() const override;

    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;
    std::optional<Envelope> HandleEnvelope(const Envelope& envelope) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// Server factory
//==========================================================================================================
class IServerFactory {
public:
    virtual ~IServerFactory() = default;
    virtual std::unique_ptr<IServer> CreateServer(const Implementation& serverInfo) = 0;
};

class ServerFactory : public IServerFactory {
public:
    explicit ServerFactory(std::shared_ptr<ToolRegistry> registry = nullptr) : registry(std::move(registry)) {}
    std::unique_ptr<IServer> CreateServer(const Implementation& serverInfo) override;

private:
    std::shared_ptr<ToolRegistry> registry;
};

} // namespace mcphub
