//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.cpp
// Purpose: Connection state machine and reader loop
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphub/Connection.h"

namespace mcphub {

const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::AwaitingInitResponse: return "AwaitingInitResponse";
        case ConnectionState::AwaitingInitializedAck: return "AwaitingInitializedAck";
        case ConnectionState::Discovering: return "Discovering";
        case ConnectionState::Ready: return "Ready";
    }
    return "Unknown";
}

class Connection::Impl {
public:
    std::string serverName;
    std::unique_ptr<ITransport> transport;
    Connection::Options opts;
    CorrelationTable table;

    mutable std::mutex stateMutex;
    ConnectionState state{ConnectionState::Disconnected};
    std::optional<Implementation> serverInfo;
    ServerCapabilities serverCapabilities;
    std::vector<std::shared_ptr<const Tool>> tools;
    std::vector<std::shared_ptr<const Resource>> resources;
    std::vector<std::shared_ptr<const Prompt>> prompts;

    std::mutex handlerMutex;
    std::unordered_map<std::string, Connection::NotificationHandler> notificationHandlers;
    Connection::ClosedHandler closedHandler;

    std::atomic<bool> tornDown{false};
    std::atomic<bool> opened{false};
    std::jthread reader;

    Impl(std::string name, std::unique_ptr<ITransport> t, Connection::Options o)
        : serverName(std::move(name)), transport(std::move(t)), opts(std::move(o)) {}

    ~Impl() {
        if (reader.joinable()) {
            if (reader.get_id() == std::this_thread::get_id()) {
                // Last reference dropped by the reader itself
                reader.detach();
            } else {
                reader.request_stop();
                reader.join();
            }
        }
    }

    void setState(ConnectionState next) {
        ConnectionState prev;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            prev = state;
            state = next;
        }
        LOG_DEBUG("Connection[{}]: {} -> {}", serverName, ConnectionStateName(prev), ConnectionStateName(next));
    }

    ConnectionState getState() const {
        std::lock_guard<std::mutex> lk(stateMutex);
        return state;
    }

    ///////////////////////////////////////////// Teardown /////////////////////////////////////////////
    void teardown(const std::string& reason) {
        if (tornDown.exchange(true)) {
            return;
        }
        LOG_INFO("Connection[{}]: teardown ({})", serverName, reason);
        try {
            transport->Close().get();
        } catch (const std::exception& e) {
            LOG_WARN("Connection[{}]: transport close failed: {}", serverName, e.what());
        }
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            state = ConnectionState::Disconnected;
            tools.clear();
            resources.clear();
            prompts.clear();
        }
        Connection::ClosedHandler onClosed;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            onClosed = closedHandler;
        }
        if (onClosed) {
            onClosed(serverName);
        }
        // Callers woken below already observe the purged catalog
        std::size_t failed = table.CancelAll(errors::makeError(
            JSONRPCErrorCodes::ConnectionClosed, "Connection to '" + serverName + "' closed: " + reason));
        if (failed > 0) {
            LOG_INFO("Connection[{}]: failed {} outstanding call(s)", serverName, failed);
        }
    }

    void joinReader() {
        if (reader.joinable() && reader.get_id() != std::this_thread::get_id()) {
            reader.request_stop();
            reader.join();
        }
    }

    ///////////////////////////////////////////// Reader /////////////////////////////////////////////
    void readerLoop(std::stop_token st) {
        LOG_DEBUG("Connection[{}]: reader started", serverName);
        while (!st.stop_requested()) {
            std::optional<DecodeResult> next;
            try {
                next = transport->Receive();
            } catch (const std::exception& e) {
                LOG_ERROR("Connection[{}]: receive failed: {}", serverName, e.what());
                break;
            }
            if (!next.has_value()) {
                break;
            }
            if (!next->ok()) {
                LOG_WARN("Connection[{}]: dropping undecodable message: {}", serverName,
                         next->error.has_value() ? next->error->message : std::string("unknown error"));
                continue;
            }
            const Envelope& env = next->envelope.value();
            if (auto invalid = Envelope::Validate(env)) {
                LOG_WARN("Connection[{}]: dropping invalid message: {}", serverName, invalid->message);
                continue;
            }
            switch (env.GetKind()) {
                case Envelope::Kind::Response:
                    handleResponse(env);
                    break;
                case Envelope::Kind::Notification:
                    handleNotification(env);
                    break;
                case Envelope::Kind::Request:
                    handleRequest(env);
                    break;
                case Envelope::Kind::Invalid:
                    LOG_WARN("Connection[{}]: dropping message of unknown shape", serverName);
                    break;
            }
        }
        teardown(st.stop_requested() ? "reader stopped" : "receive stream ended");
        LOG_DEBUG("Connection[{}]: reader exited", serverName);
    }

    void handleResponse(const Envelope& env) {
        const int64_t* id = env.id.has_value() ? std::get_if<int64_t>(&env.id.value()) : nullptr;
        if (id == nullptr) {
            LOG_DEBUG("Connection[{}]: dropping response with foreign id {}", serverName,
                      env.id.has_value() ? IdToString(env.id.value()) : std::string("<none>"));
            return;
        }
        if (!table.Resolve(*id, env)) {
            LOG_DEBUG("Connection[{}]: no pending call for response id {} (late or duplicate)", serverName, *id);
        }
    }

    void handleNotification(const Envelope& env) {
        const std::string& method = env.method.value();
        JSONValue params = env.params.value_or(JSONValue{JSONValue::Object{}});
        Connection::NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            auto it = notificationHandlers.find(method);
            if (it != notificationHandlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            if (method == Methods::Progress || method == Methods::ProgressNotification) {
                LOG_INFO("Connection[{}]: progress {}", serverName, SerializeJSON(params));
            } else {
                LOG_DEBUG("Connection[{}]: unhandled notification {}", serverName, method);
            }
            return;
        }
        try {
            handler(method, params);
        } catch (const std::exception& e) {
            LOG_WARN("Connection[{}]: notification handler for {} threw: {}", serverName, method, e.what());
        }
    }

    // Server-initiated requests: only ping is served.
    void handleRequest(const Envelope& env) {
        const std::string& method = env.method.value();
        Envelope reply = method == Methods::Ping
            ? Envelope::MakeResult(env.id.value(), JSONValue{JSONValue::Object{}})
            : Envelope::MakeError(env.id, errors::makeError(JSONRPCErrorCodes::MethodNotFound,
                                                            "Method not found: " + method));
        try {
            transport->Send(reply);
        } catch (const errors::McpException& e) {
            LOG_WARN("Connection[{}]: failed to answer {}: {}", serverName, method, e.what());
        }
    }

    ///////////////////////////////////////////// Discovery /////////////////////////////////////////////
    template <class T, class Parse>
    std::vector<std::shared_ptr<const T>> discover(Connection& self, const char* method, const char* key,
                                                    Parse parse) {
        std::vector<std::shared_ptr<const T>> out;
        try {
            JSONValue result = self.Request(method, JSONValue{JSONValue::Object{}}, opts.handshakeTimeout);
            const JSONValue* list = FindMember(result, key);
            if (list == nullptr || !list->isArray()) {
                LOG_WARN("Connection[{}]: {} result has no '{}' array", serverName, method, key);
                return out;
            }
            for (const auto& item : std::get<JSONValue::Array>(list->value)) {
                if (!item) {
                    continue;
                }
                auto parsed = parse(*item);
                if (!parsed.has_value()) {
                    LOG_WARN("Connection[{}]: skipping malformed {} entry", serverName, key);
                    continue;
                }
                out.push_back(std::make_shared<const T>(std::move(parsed.value())));
            }
        } catch (const errors::McpException& e) {
            LOG_WARN("Connection[{}]: {} failed, leaving {} empty: {}", serverName, method, key, e.what());
        }
        return out;
    }
};

Connection::Connection(std::string serverName, std::unique_ptr<ITransport> transport, Options opts)
    : pImpl(std::make_shared<Impl>(std::move(serverName), std::move(transport), std::move(opts))) {}

Connection::~Connection() {
    Close();
}

void Connection::Open() {
    FUNC_SCOPE();
    if (pImpl->opened.exchange(true)) {
        throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                   "Connection '" + pImpl->serverName + "' already opened");
    }
    const std::string& name = pImpl->serverName;

    pImpl->setState(ConnectionState::Connecting);
    try {
        pImpl->transport->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Connection[{}]: transport failed to start: {}", name, e.what());
        pImpl->teardown("transport failed to start");
        throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                   "Failed to connect to '" + name + "': " + e.what());
    }

    pImpl->setState(ConnectionState::AwaitingInitResponse);
    pImpl->reader = std::jthread([self = pImpl](std::stop_token st) { self->readerLoop(st); });

    JSONValue::Object params;
    SetMember(params, "protocolVersion", JSONValue(PROTOCOL_VERSION));
    SetMember(params, "capabilities", ClientCapabilitiesToJSON(pImpl->opts.capabilities));
    SetMember(params, "clientInfo", ImplementationToJSON(pImpl->opts.clientInfo));

    JSONValue result;
    try {
        result = Request(Methods::Initialize, JSONValue{std::move(params)}, pImpl->opts.handshakeTimeout);
    } catch (const errors::McpException& e) {
        LOG_ERROR("Connection[{}]: initialize failed: {}", name, e.what());
        Close();
        throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                   "Initialize with '" + name + "' failed: " + e.what(),
                                   errors::makeErrorValue(e.error()));
    }

    auto serverVersion = GetStringMember(result, "protocolVersion");
    if (serverVersion.has_value() && serverVersion.value() != PROTOCOL_VERSION) {
        LOG_WARN("Connection[{}]: server speaks protocol {}, client {}", name, serverVersion.value(), PROTOCOL_VERSION);
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        if (const JSONValue* info = FindMember(result, "serverInfo")) {
            pImpl->serverInfo = ImplementationFromJSON(*info);
        }
        if (const JSONValue* caps = FindMember(result, "capabilities")) {
            pImpl->serverCapabilities = ServerCapabilitiesFromJSON(*caps);
        }
    }
    pImpl->setState(ConnectionState::AwaitingInitializedAck);

    try {
        SendNotification(Methods::Initialized);
    } catch (const errors::McpException& e) {
        Close();
        throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                   "Failed to acknowledge initialize with '" + name + "': " + e.what());
    }

    pImpl->setState(ConnectionState::Discovering);
    ServerCapabilities caps = GetServerCapabilities();
    std::vector<std::shared_ptr<const Tool>> tools;
    std::vector<std::shared_ptr<const Resource>> resources;
    std::vector<std::shared_ptr<const Prompt>> prompts;
    if (caps.tools.has_value()) {
        tools = pImpl->discover<Tool>(*this, Methods::ListTools, "tools", ToolFromJSON);
    }
    if (caps.resources.has_value()) {
        resources = pImpl->discover<Resource>(*this, Methods::ListResources, "resources", ResourceFromJSON);
    }
    if (caps.prompts.has_value()) {
        prompts = pImpl->discover<Prompt>(*this, Methods::ListPrompts, "prompts", PromptFromJSON);
    }

    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        if (pImpl->state != ConnectionState::Discovering) {
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                       "Connection to '" + name + "' closed during discovery");
        }
        pImpl->tools = std::move(tools);
        pImpl->resources = std::move(resources);
        pImpl->prompts = std::move(prompts);
        pImpl->state = ConnectionState::Ready;
    }
    LOG_INFO("Connection[{}]: ready ({} tools, {} resources, {} prompts)", name,
             GetTools().size(), GetResources().size(), GetPrompts().size());
}

void Connection::Close() {
    FUNC_SCOPE();
    pImpl->teardown("closed by client");
    pImpl->joinReader();
}

ConnectionState Connection::GetState() const {
    return pImpl->getState();
}

const std::string& Connection::GetServerName() const {
    return pImpl->serverName;
}

std::optional<Implementation> Connection::GetServerInfo() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->serverInfo;
}

ServerCapabilities Connection::GetServerCapabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->serverCapabilities;
}

std::vector<std::shared_ptr<const Tool>> Connection::GetTools() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->tools;
}

std::vector<std::shared_ptr<const Resource>> Connection::GetResources() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->resources;
}

std::vector<std::shared_ptr<const Prompt>> Connection::GetPrompts() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->prompts;
}

CorrelationTable::PendingCall Connection::SendRequest(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    auto call = pImpl->table.Register();
    if (pImpl->table.IsClosed()) {
        // Slot already failed by a completed teardown
        return call;
    }
    try {
        pImpl->transport->Send(Envelope::MakeRequest(JSONRPCId{call.id}, method, std::move(params)));
    } catch (const errors::McpException& e) {
        pImpl->table.Cancel(call.id);
        LOG_WARN("Connection[{}]: failed to send {} (id {}): {}", pImpl->serverName, method, call.id, e.what());
        throw;
    }
    LOG_DEBUG("Connection[{}]: sent {} (id {})", pImpl->serverName, method, call.id);
    return call;
}

JSONValue Connection::AwaitResult(CorrelationTable::PendingCall call, std::chrono::milliseconds timeout,
                                  const std::string& method) {
    if (call.result.wait_for(timeout) != std::future_status::ready) {
        if (pImpl->table.Cancel(call.id)) {
            LOG_WARN("Connection[{}]: {} (id {}) timed out after {} ms", pImpl->serverName, method, call.id,
                     timeout.count());
            throw errors::McpException(JSONRPCErrorCodes::Timeout,
                                       method + " on '" + pImpl->serverName + "' timed out after " +
                                       std::to_string(timeout.count()) + " ms");
        }
        // Resolved between the wait and the cancel; the value is already set
    }
    Envelope response = call.result.get();
    if (response.error.has_value()) {
        throw errors::McpException(response.error.value());
    }
    return response.result.value_or(JSONValue{JSONValue::Object{}});
}

JSONValue Connection::Request(const std::string& method, std::optional<JSONValue> params,
                              std::chrono::milliseconds timeout) {
    return AwaitResult(SendRequest(method, std::move(params)), timeout, method);
}

void Connection::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    pImpl->transport->Send(Envelope::MakeNotification(method, std::move(params)));
}

void Connection::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    if (handler) {
        pImpl->notificationHandlers[method] = std::move(handler);
    } else {
        pImpl->notificationHandlers.erase(method);
    }
}

void Connection::SetClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->closedHandler = std::move(handler);
}

std::size_t Connection::PendingCount() const {
    return pImpl->table.Size();
}

} // namespace mcphub
