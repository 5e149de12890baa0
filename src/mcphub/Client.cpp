//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Multi-server client implementation
//==========================================================================================================

#include <algorithm>
#include <map>
#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphub/Client.h"

namespace mcphub {

namespace {

template <class T>
std::future<T> failedFuture(const errors::McpException& e) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(e));
    return p.get_future();
}

} // namespace

class Client::Impl {
public:
    struct ConnectionEntry {
        std::shared_ptr<Connection> conn;
        std::chrono::milliseconds requestTimeout;
    };

    // One aggregate index row; `key` is the item's name (tool, prompt) or uri (resource)
    template <class T>
    struct IndexEntry {
        std::string server;
        std::string key;
        std::shared_ptr<const T> item;
        std::shared_ptr<Connection> conn;
    };

    Implementation clientInfo;
    ClientCapabilities capabilities;

    mutable std::mutex mutex;
    std::map<std::string, ConnectionEntry> connections;
    std::vector<IndexEntry<Tool>> toolIndex;
    std::vector<IndexEntry<Resource>> resourceIndex;
    std::vector<IndexEntry<Prompt>> promptIndex;
    std::unordered_map<std::string, Connection::NotificationHandler> notificationHandlers;

    Impl(const Implementation& info, const ClientCapabilities& caps) : clientInfo(info), capabilities(caps) {}

    ///////////////////////////////////////////// Index maintenance /////////////////////////////////////////////
    template <class T>
    void indexLocked(std::vector<IndexEntry<T>>& index, const char* kind, const std::string& server,
                     const std::shared_ptr<Connection>& conn, const std::vector<std::shared_ptr<const T>>& items,
                     std::string (*keyOf)(const T&)) {
        for (const auto& item : items) {
            std::string key = keyOf(*item);
            auto sameKey = [&key](const IndexEntry<T>& e) { return e.key == key; };
            auto owner = std::find_if(index.begin(), index.end(), sameKey);
            if (owner != index.end()) {
                if (owner->server == server) {
                    LOG_WARN("Client: server '{}' advertised {} '{}' twice; keeping the first", server, kind, key);
                    continue;
                }
                LOG_WARN("Client: {} '{}' from '{}' is shadowed by '{}'", kind, key, server, owner->server);
            }
            index.push_back(IndexEntry<T>{server, key, item, conn});
        }
    }

    template <class T>
    static void purgeLocked(std::vector<IndexEntry<T>>& index, const Connection* conn) {
        index.erase(std::remove_if(index.begin(), index.end(),
                                   [conn](const IndexEntry<T>& e) { return e.conn.get() == conn; }),
                    index.end());
    }

    void purgeAllLocked(const Connection* conn) {
        purgeLocked(toolIndex, conn);
        purgeLocked(resourceIndex, conn);
        purgeLocked(promptIndex, conn);
    }

    // Runs on whichever thread tore the connection down.
    void onConnectionClosed(const std::string& server, const Connection* conn) {
        std::lock_guard<std::mutex> lk(mutex);
        purgeAllLocked(conn);
        LOG_INFO("Client: server '{}' disconnected; its items were removed", server);
    }

    template <class T>
    static std::vector<std::string> keysOf(const std::vector<IndexEntry<T>>& index) {
        std::vector<std::string> out;
        out.reserve(index.size());
        for (const auto& e : index) {
            out.push_back(e.server + ":" + e.key);
        }
        return out;
    }

    // First-registered owner of key.
    template <class T>
    static const IndexEntry<T>* findLocked(const std::vector<IndexEntry<T>>& index, const std::string& key) {
        auto it = std::find_if(index.begin(), index.end(), [&key](const IndexEntry<T>& e) { return e.key == key; });
        return it == index.end() ? nullptr : &*it;
    }

    std::chrono::milliseconds timeoutFor(const std::string& server,
                                         std::optional<std::chrono::milliseconds> requested) const {
        if (requested.has_value()) {
            return requested.value();
        }
        auto it = connections.find(server);
        return it != connections.end() ? it->second.requestTimeout : ServerConfig{}.requestTimeout;
    }

    ///////////////////////////////////////////// Connect / disconnect /////////////////////////////////////////////
    std::shared_ptr<Connection> detach(const std::string& name) {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = connections.find(name);
        if (it == connections.end()) {
            return nullptr;
        }
        auto conn = it->second.conn;
        connections.erase(it);
        purgeAllLocked(conn.get());
        return conn;
    }

    void connect(const std::string& name, std::unique_ptr<ITransport> transport, const ServerConfig& config) {
        FUNC_SCOPE();
        if (name.empty()) {
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed, "Server name must not be empty");
        }
        if (auto old = detach(name)) {
            LOG_INFO("Client: reconnecting '{}'; closing previous connection", name);
            old->Close();
        }

        Connection::Options opts;
        opts.clientInfo = clientInfo;
        opts.capabilities = capabilities;
        opts.handshakeTimeout = config.handshakeTimeout;
        auto conn = std::make_shared<Connection>(name, std::move(transport), opts);
        const Connection* raw = conn.get();
        conn->SetClosedHandler([this, raw](const std::string& server) { onConnectionClosed(server, raw); });
        {
            std::lock_guard<std::mutex> lk(mutex);
            for (const auto& [method, handler] : notificationHandlers) {
                conn->SetNotificationHandler(method, handler);
            }
            connections[name] = ConnectionEntry{conn, config.requestTimeout};
        }

        try {
            conn->Open();
        } catch (const errors::McpException&) {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = connections.find(name);
            if (it != connections.end() && it->second.conn == conn) {
                connections.erase(it);
            }
            throw;
        }

        std::lock_guard<std::mutex> lk(mutex);
        auto it = connections.find(name);
        if (it == connections.end() || it->second.conn != conn || conn->GetState() != ConnectionState::Ready) {
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                       "Connection to '" + name + "' was closed before it became ready");
        }
        indexLocked<Tool>(toolIndex, "tool", name, conn, conn->GetTools(),
                          [](const Tool& t) { return t.name; });
        indexLocked<Resource>(resourceIndex, "resource", name, conn, conn->GetResources(),
                              [](const Resource& r) { return r.uri; });
        indexLocked<Prompt>(promptIndex, "prompt", name, conn, conn->GetPrompts(),
                            [](const Prompt& p) { return p.name; });
        LOG_INFO("Client: server '{}' connected", name);
    }

    ///////////////////////////////////////////// Calls /////////////////////////////////////////////
    // Looks up the owner and sends on the caller's thread; only the wait happens asynchronously.
    template <class T, class Item, class Parse>
    std::future<T> invoke(const std::vector<IndexEntry<Item>>& index, const std::string& key, int notFoundCode,
                          const char* kind, const char* method, JSONValue params,
                          std::optional<std::chrono::milliseconds> timeout, Parse parse) {
        std::shared_ptr<Connection> conn;
        std::chrono::milliseconds wait{0};
        {
            std::lock_guard<std::mutex> lk(mutex);
            const IndexEntry<Item>* owner = findLocked(index, key);
            if (owner == nullptr) {
                LOG_DEBUG("Client: no connected server offers {} '{}'", kind, key);
                return failedFuture<T>(errors::McpException(notFoundCode, std::string(kind) + " not found: " + key));
            }
            conn = owner->conn;
            wait = timeoutFor(owner->server, timeout);
        }

        CorrelationTable::PendingCall call;
        try {
            call = conn->SendRequest(method, std::move(params));
        } catch (const errors::McpException& e) {
            return failedFuture<T>(e);
        }
        return std::async(std::launch::async,
                          [conn, call = std::move(call), wait, method, parse]() mutable -> T {
            JSONValue result = conn->AwaitResult(std::move(call), wait, method);
            auto parsed = parse(result);
            if (!parsed.has_value()) {
                throw errors::McpException(JSONRPCErrorCodes::InternalError,
                                           std::string("Malformed ") + method + " result from '" +
                                           conn->GetServerName() + "'");
            }
            return std::move(parsed.value());
        });
    }
};

Client::Client(const Implementation& clientInfo, const ClientCapabilities& capabilities)
    : pImpl(std::make_unique<Impl>(clientInfo, capabilities)) {
    FUNC_SCOPE();
}

Client::~Client() {
    try {
        Shutdown().get();
    } catch (const std::exception& e) {
        LOG_WARN("Client: shutdown during destruction failed: {}", e.what());
    }
}

std::future<void> Client::ConnectServer(const std::string& name, const ServerConfig& config) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, name, config]() {
        std::unique_ptr<ITransport> transport;
        try {
            transport = TransportFactory().CreateTransport(config);
        } catch (const std::invalid_argument& e) {
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed, e.what());
        }
        pImpl->connect(name, std::move(transport), config);
    });
}

std::future<void> Client::ConnectServer(const std::string& name, std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, name, t = std::move(transport)]() mutable {
        pImpl->connect(name, std::move(t), ServerConfig{});
    });
}

std::future<void> Client::DisconnectServer(const std::string& name) {
    FUNC_SCOPE();
    std::promise<void> done;
    auto conn = pImpl->detach(name);
    if (conn) {
        conn->Close();
        LOG_INFO("Client: server '{}' disconnected", name);
    } else {
        LOG_DEBUG("Client: DisconnectServer('{}'): not connected", name);
    }
    done.set_value();
    return done.get_future();
}

std::future<void> Client::Shutdown() {
    FUNC_SCOPE();
    std::vector<std::shared_ptr<Connection>> all;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (auto& [name, entry] : pImpl->connections) {
            all.push_back(entry.conn);
        }
        pImpl->connections.clear();
        pImpl->toolIndex.clear();
        pImpl->resourceIndex.clear();
        pImpl->promptIndex.clear();
    }
    for (auto& conn : all) {
        conn->Close();
    }
    if (!all.empty()) {
        LOG_INFO("Client: shut down {} connection(s)", all.size());
    }
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

std::future<ToolResult> Client::CallTool(const std::string& toolName, const JSONValue& arguments,
                                         std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    JSONValue::Object params;
    SetMember(params, "name", JSONValue(toolName));
    SetMember(params, "arguments", arguments);
    return pImpl->invoke<ToolResult>(pImpl->toolIndex, toolName, JSONRPCErrorCodes::ToolNotFound, "Tool",
                                     Methods::CallTool, JSONValue{std::move(params)}, timeout,
                                     CallToolResultFromJSON);
}

std::future<ReadResourceResult> Client::ReadResource(const std::string& uri,
                                                     std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    JSONValue::Object params;
    SetMember(params, "uri", JSONValue(uri));
    return pImpl->invoke<ReadResourceResult>(pImpl->resourceIndex, uri, JSONRPCErrorCodes::ResourceNotFound,
                                             "Resource", Methods::ReadResource, JSONValue{std::move(params)},
                                             timeout, ReadResourceResultFromJSON);
}

std::future<GetPromptResult> Client::GetPrompt(const std::string& name, const JSONValue& arguments,
                                               std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    JSONValue::Object params;
    SetMember(params, "name", JSONValue(name));
    SetMember(params, "arguments", arguments);
    return pImpl->invoke<GetPromptResult>(pImpl->promptIndex, name, JSONRPCErrorCodes::PromptNotFound, "Prompt",
                                          Methods::GetPrompt, JSONValue{std::move(params)}, timeout,
                                          GetPromptResultFromJSON);
}

std::future<void> Client::Ping(const std::string& server, std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    std::shared_ptr<Connection> conn;
    std::chrono::milliseconds wait{0};
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->connections.find(server);
        if (it == pImpl->connections.end() || it->second.conn->GetState() != ConnectionState::Ready) {
            return failedFuture<void>(errors::McpException(JSONRPCErrorCodes::ConnectionClosed,
                                                           "Server '" + server + "' is not connected"));
        }
        conn = it->second.conn;
        wait = pImpl->timeoutFor(server, timeout);
    }
    CorrelationTable::PendingCall call;
    try {
        call = conn->SendRequest(Methods::Ping, std::nullopt);
    } catch (const errors::McpException& e) {
        return failedFuture<void>(e);
    }
    return std::async(std::launch::async, [conn, call = std::move(call), wait]() mutable {
        (void)conn->AwaitResult(std::move(call), wait, Methods::Ping);
    });
}

std::vector<std::string> Client::ListConnectedServers() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<std::string> out;
    for (const auto& [name, entry] : pImpl->connections) {
        if (entry.conn->GetState() == ConnectionState::Ready) {
            out.push_back(name);
        }
    }
    return out;
}

std::vector<std::string> Client::ListTools() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return Impl::keysOf(pImpl->toolIndex);
}

std::vector<std::string> Client::ListResources() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return Impl::keysOf(pImpl->resourceIndex);
}

std::vector<std::string> Client::ListPrompts() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return Impl::keysOf(pImpl->promptIndex);
}

std::vector<ServerTool> Client::GetAvailableTools() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<ServerTool> out;
    for (const auto& e : pImpl->toolIndex) {
        out.push_back(ServerTool{e.server, *e.item});
    }
    return out;
}

std::vector<ServerResource> Client::GetAvailableResources() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<ServerResource> out;
    for (const auto& e : pImpl->resourceIndex) {
        out.push_back(ServerResource{e.server, *e.item});
    }
    return out;
}

std::vector<ServerPrompt> Client::GetAvailablePrompts() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<ServerPrompt> out;
    for (const auto& e : pImpl->promptIndex) {
        out.push_back(ServerPrompt{e.server, *e.item});
    }
    return out;
}

std::optional<ConnectionState> Client::GetServerState(const std::string& name) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->connections.find(name);
    if (it == pImpl->connections.end()) {
        return std::nullopt;
    }
    return it->second.conn->GetState();
}

void Client::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (handler) {
        pImpl->notificationHandlers[method] = handler;
    } else {
        pImpl->notificationHandlers.erase(method);
    }
    for (auto& [name, entry] : pImpl->connections) {
        entry.conn->SetNotificationHandler(method, handler);
    }
}

std::unique_ptr<IClient> ClientFactory::CreateClient(const Implementation& clientInfo) {
    return std::make_unique<Client>(clientInfo);
}

} // namespace mcphub
