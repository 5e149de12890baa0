//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server dispatcher implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <list>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphub/Server.h"

namespace mcphub {

std::optional<BuiltinMethod> ParseBuiltinMethod(const std::string& method) {
    static const std::unordered_map<std::string, BuiltinMethod> table = {
        {Methods::Initialize, BuiltinMethod::Initialize},
        {Methods::ListTools, BuiltinMethod::ListTools},
        {Methods::CallTool, BuiltinMethod::CallTool},
        {Methods::ListResources, BuiltinMethod::ListResources},
        {Methods::ReadResource, BuiltinMethod::ReadResource},
        {Methods::ListPrompts, BuiltinMethod::ListPrompts},
        {Methods::GetPrompt, BuiltinMethod::GetPrompt},
        {Methods::Ping, BuiltinMethod::Ping},
    };
    auto it = table.find(method);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

namespace {

std::string requireString(const JSONValue& params, const char* key) {
    auto v = GetStringMember(params, key);
    if (!v.has_value() || v->empty()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                   std::string("Invalid params: missing '") + key + "'");
    }
    return v.value();
}

JSONValue argumentsOf(const JSONValue& params) {
    const JSONValue* args = FindMember(params, "arguments");
    if (args == nullptr || args->isNull()) {
        return JSONValue{JSONValue::Object{}};
    }
    return *args;
}

} // namespace

class Server::Impl {
public:
    Implementation serverInfo;
    std::shared_ptr<ToolRegistry> registry;
    std::unique_ptr<ITransport> transport;

    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};
    std::atomic<bool> stopping{false};
    std::optional<Implementation> clientInfo;  // guarded by registryMutex

    mutable std::mutex registryMutex;
    struct ResourceEntry {
        Resource resource;
        ResourceHandler handler;
    };
    struct PromptEntry {
        Prompt prompt;
        PromptHandler handler;
    };
    std::vector<ResourceEntry> resources;
    std::vector<PromptEntry> prompts;
    ServerCapabilities configuredCapabilities;

    // In-flight request handlers
    std::stop_source handlerStop;
    std::mutex tasksMutex;
    std::list<std::future<void>> tasks;

    std::jthread reader;
    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool done{false};

    Impl(const Implementation& info, std::shared_ptr<ToolRegistry> reg)
        : serverInfo(info), registry(reg ? std::move(reg) : std::make_shared<ToolRegistry>()) {}

    void send(const Envelope& env) {
        if (!transport) {
            return;
        }
        try {
            transport->Send(env);
        } catch (const errors::McpException& e) {
            LOG_WARN("Server: failed to send reply: {}", e.what());
        }
    }

    void markDone() {
        running = false;
        {
            std::lock_guard<std::mutex> lk(doneMutex);
            done = true;
        }
        doneCv.notify_all();
    }

    void spawn(std::function<void()> work) {
        std::lock_guard<std::mutex> lk(tasksMutex);
        tasks.remove_if([](std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
        tasks.push_back(std::async(std::launch::async, std::move(work)));
    }

    void waitTasks() {
        std::list<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lk(tasksMutex);
            pending.swap(tasks);
        }
        for (auto& f : pending) {
            f.wait();
        }
    }

    ///////////////////////////////////////////// Receive loop /////////////////////////////////////////////
    void receiveLoop(Server& self, std::stop_token st) {
        LOG_DEBUG("Server: receive loop started");
        while (!st.stop_requested()) {
            std::optional<DecodeResult> next;
            try {
                next = transport->Receive();
            } catch (const std::exception& e) {
                LOG_ERROR("Server: receive failed: {}", e.what());
                break;
            }
            if (!next.has_value()) {
                break;
            }
            if (!next->ok()) {
                errors::McpError err = next->error.value_or(
                    errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error"));
                LOG_WARN("Server: undecodable message: {}", err.message);
                std::optional<JSONRPCId> id = err.code == JSONRPCErrorCodes::ParseError
                    ? std::optional<JSONRPCId>(nullptr) : next->id;
                send(Envelope::MakeError(id, err));
                continue;
            }
            Envelope env = std::move(next->envelope.value());
            if (auto invalid = Envelope::Validate(env)) {
                LOG_WARN("Server: invalid message: {}", invalid->message);
                if (env.id.has_value() && !env.result.has_value() && !env.error.has_value()) {
                    send(Envelope::MakeError(env.id, invalid.value()));
                }
                continue;
            }
            switch (env.GetKind()) {
                case Envelope::Kind::Request:
                    spawn([this, &self, env = std::move(env)]() {
                        auto reply = self.HandleEnvelope(env);
                        if (reply.has_value()) {
                            send(reply.value());
                        }
                    });
                    break;
                case Envelope::Kind::Notification:
                    // Inline so `initialized` takes effect before any later request is dispatched
                    (void)self.HandleEnvelope(env);
                    break;
                case Envelope::Kind::Response:
                case Envelope::Kind::Invalid:
                    LOG_DEBUG("Server: ignoring unsolicited response");
                    break;
            }
        }
        LOG_INFO("Server: receive loop ended");
        markDone();
    }

    ///////////////////////////////////////////// Built-in methods /////////////////////////////////////////////
    ServerCapabilities effectiveCapabilities() const {
        std::lock_guard<std::mutex> lk(registryMutex);
        ServerCapabilities caps = configuredCapabilities;
        if (!caps.tools.has_value() && registry->Size() > 0) {
            caps.tools = ToolsCapability{};
        }
        if (!caps.resources.has_value() && !resources.empty()) {
            caps.resources = ResourcesCapability{};
        }
        if (!caps.prompts.has_value() && !prompts.empty()) {
            caps.prompts = PromptsCapability{};
        }
        return caps;
    }

    JSONValue handleInitialize(const JSONValue& params) {
        auto requested = GetStringMember(params, "protocolVersion");
        std::optional<Implementation> peer;
        if (const JSONValue* info = FindMember(params, "clientInfo")) {
            peer = ImplementationFromJSON(*info);
        }
        {
            std::lock_guard<std::mutex> lk(registryMutex);
            clientInfo = peer;
        }
        LOG_INFO("Server: initialize from {} (protocol {})",
                 peer.has_value() ? peer->name : std::string("<unknown client>"),
                 requested.value_or("<none>"));
        JSONValue::Object result;
        SetMember(result, "protocolVersion", JSONValue(PROTOCOL_VERSION));
        SetMember(result, "capabilities", ServerCapabilitiesToJSON(effectiveCapabilities()));
        SetMember(result, "serverInfo", ImplementationToJSON(serverInfo));
        return JSONValue{std::move(result)};
    }

    JSONValue handleListTools() {
        JSONValue::Array list;
        for (const auto& t : registry->ListTools()) {
            list.push_back(std::make_shared<JSONValue>(ToolToJSON(t)));
        }
        JSONValue::Object result;
        SetMember(result, "tools", JSONValue{std::move(list)});
        return JSONValue{std::move(result)};
    }

    JSONValue handleCallTool(const JSONValue& params) {
        std::string name = requireString(params, "name");
        auto fut = registry->CallTool(name, argumentsOf(params), handlerStop.get_token());
        return CallToolResultToJSON(fut.get());
    }

    JSONValue handleListResources() {
        JSONValue::Array list;
        {
            std::lock_guard<std::mutex> lk(registryMutex);
            for (const auto& e : resources) {
                list.push_back(std::make_shared<JSONValue>(ResourceToJSON(e.resource)));
            }
        }
        JSONValue::Object result;
        SetMember(result, "resources", JSONValue{std::move(list)});
        return JSONValue{std::move(result)};
    }

    JSONValue handleReadResource(const JSONValue& params) {
        std::string uri = requireString(params, "uri");
        ResourceHandler handler;
        {
            std::lock_guard<std::mutex> lk(registryMutex);
            auto it = std::find_if(resources.begin(), resources.end(),
                                   [&uri](const ResourceEntry& e) { return e.resource.uri == uri; });
            if (it != resources.end()) {
                handler = it->handler;
            }
        }
        if (!handler) {
            throw errors::McpException(JSONRPCErrorCodes::ResourceNotFound, "Resource not found: " + uri);
        }
        return ReadResourceResultToJSON(handler(uri, handlerStop.get_token()).get());
    }

    JSONValue handleListPrompts() {
        JSONValue::Array list;
        {
            std::lock_guard<std::mutex> lk(registryMutex);
            for (const auto& e : prompts) {
                list.push_back(std::make_shared<JSONValue>(PromptToJSON(e.prompt)));
            }
        }
        JSONValue::Object result;
        SetMember(result, "prompts", JSONValue{std::move(list)});
        return JSONValue{std::move(result)};
    }

    JSONValue handleGetPrompt(const JSONValue& params) {
        std::string name = requireString(params, "name");
        PromptHandler handler;
        {
            std::lock_guard<std::mutex> lk(registryMutex);
            auto it = std::find_if(prompts.begin(), prompts.end(),
                                   [&name](const PromptEntry& e) { return e.prompt.name == name; });
            if (it != prompts.end()) {
                handler = it->handler;
            }
        }
        if (!handler) {
            throw errors::McpException(JSONRPCErrorCodes::PromptNotFound, "Prompt not found: " + name);
        }
        return GetPromptResultToJSON(handler(argumentsOf(params)));
    }

    JSONValue dispatch(BuiltinMethod method, const JSONValue& params) {
        switch (method) {
            case BuiltinMethod::Initialize: return handleInitialize(params);
            case BuiltinMethod::ListTools: return handleListTools();
            case BuiltinMethod::CallTool: return handleCallTool(params);
            case BuiltinMethod::ListResources: return handleListResources();
            case BuiltinMethod::ReadResource: return handleReadResource(params);
            case BuiltinMethod::ListPrompts: return handleListPrompts();
            case BuiltinMethod::GetPrompt: return handleGetPrompt(params);
            case BuiltinMethod::Ping: return JSONValue{JSONValue::Object{}};
        }
        throw errors::McpException(JSONRPCErrorCodes::InternalError, "Unhandled built-in method");
    }
};

Server::Server(const Implementation& serverInfo, std::shared_ptr<ToolRegistry> registry)
    : pImpl(std::make_unique<Impl>(serverInfo, std::move(registry))) {
    FUNC_SCOPE();
}

Server::~Server() {
    try {
        Stop().get();
    } catch (const std::exception& e) {
        LOG_WARN("Server: stop during destruction failed: {}", e.what());
    }
}

std::future<void> Server::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->transport) {
        ready.set_exception(std::make_exception_ptr(
            errors::McpException(JSONRPCErrorCodes::InternalError, "Server already started")));
        return fut;
    }
    pImpl->transport = std::move(transport);
    try {
        pImpl->transport->Start().get();
    } catch (const std::exception&) {
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running = true;
    pImpl->reader = std::jthread([this](std::stop_token st) { pImpl->receiveLoop(*this, st); });
    LOG_INFO("Server: {} {} started", pImpl->serverInfo.name, pImpl->serverInfo.version);
    ready.set_value();
    return fut;
}

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->stopping.exchange(true)) {
        done.set_value();
        return fut;
    }
    pImpl->handlerStop.request_stop();
    if (pImpl->transport) {
        try {
            pImpl->transport->Close().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Server: transport close failed: {}", e.what());
        }
    }
    if (pImpl->reader.joinable()) {
        pImpl->reader.request_stop();
        pImpl->reader.join();
    }
    pImpl->waitTasks();
    pImpl->markDone();
    done.set_value();
    return fut;
}

void Server::Wait() {
    std::unique_lock<std::mutex> lk(pImpl->doneMutex);
    pImpl->doneCv.wait(lk, [this]() { return pImpl->done || !pImpl->transport; });
}

bool Server::IsRunning() const {
    return pImpl->running;
}

bool Server::IsInitialized() const {
    return pImpl->initialized;
}

std::shared_ptr<ToolRegistry> Server::GetToolRegistry() const {
    return pImpl->registry;
}

void Server::RegisterResource(const Resource& resource, ResourceHandler handler) {
    FUNC_SCOPE();
    if (resource.uri.empty() || !handler) {
        throw std::invalid_argument("Server: resource needs a uri and a handler");
    }
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    auto it = std::find_if(pImpl->resources.begin(), pImpl->resources.end(),
                           [&resource](const Impl::ResourceEntry& e) { return e.resource.uri == resource.uri; });
    if (it != pImpl->resources.end()) {
        *it = Impl::ResourceEntry{resource, std::move(handler)};
    } else {
        pImpl->resources.push_back(Impl::ResourceEntry{resource, std::move(handler)});
    }
    LOG_DEBUG("Registered resource: {}", resource.uri);
}

void Server::UnregisterResource(const std::string& uri) {
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    auto& r = pImpl->resources;
    r.erase(std::remove_if(r.begin(), r.end(), [&uri](const Impl::ResourceEntry& e) { return e.resource.uri == uri; }),
            r.end());
}

std::vector<Resource> Server::ListResources() const {
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    std::vector<Resource> out;
    for (const auto& e : pImpl->resources) {
        out.push_back(e.resource);
    }
    return out;
}

void Server::RegisterPrompt(const Prompt& prompt, PromptHandler handler) {
    FUNC_SCOPE();
    if (prompt.name.empty() || !handler) {
        throw std::invalid_argument("Server: prompt needs a name and a handler");
    }
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    auto it = std::find_if(pImpl->prompts.begin(), pImpl->prompts.end(),
                           [&prompt](const Impl::PromptEntry& e) { return e.prompt.name == prompt.name; });
    if (it != pImpl->prompts.end()) {
        *it = Impl::PromptEntry{prompt, std::move(handler)};
    } else {
        pImpl->prompts.push_back(Impl::PromptEntry{prompt, std::move(handler)});
    }
    LOG_DEBUG("Registered prompt: {}", prompt.name);
}

void Server::UnregisterPrompt(const std::string& name) {
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    auto& p = pImpl->prompts;
    p.erase(std::remove_if(p.begin(), p.end(), [&name](const Impl::PromptEntry& e) { return e.prompt.name == name; }),
            p.end());
}

std::vector<Prompt> Server::ListPrompts() const {
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    std::vector<Prompt> out;
    for (const auto& e : pImpl->prompts) {
        out.push_back(e.prompt);
    }
    return out;
}

void Server::SetCapabilities(const ServerCapabilities& capabilities) {
    std::lock_guard<std::mutex> lk(pImpl->registryMutex);
    pImpl->configuredCapabilities = capabilities;
}

ServerCapabilities Server::GetCapabilities() const {
    return pImpl->effectiveCapabilities();
}

void Server::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    if (!pImpl->transport || !pImpl->running) {
        throw errors::McpException(JSONRPCErrorCodes::TransportClosed, "Server is not running");
    }
    pImpl->transport->Send(Envelope::MakeNotification(method, std::move(params)));
}

std::optional<Envelope> Server::HandleEnvelope(const Envelope& envelope) {
    FUNC_SCOPE();
    switch (envelope.GetKind()) {
        case Envelope::Kind::Notification: {
            const std::string& method = envelope.method.value();
            if (method == Methods::Initialized || method == Methods::InitializedNotification) {
                if (!pImpl->initialized.exchange(true)) {
                    LOG_INFO("Server: client initialized");
                }
            } else {
                LOG_DEBUG("Server: ignoring notification {}", method);
            }
            return std::nullopt;
        }
        case Envelope::Kind::Request:
            break;
        case Envelope::Kind::Response:
        case Envelope::Kind::Invalid:
            return std::nullopt;
    }

    const JSONRPCId& id = envelope.id.value();
    const std::string& method = envelope.method.value();
    LOG_DEBUG("Server: request {} (id {})", method, IdToString(id));

    if (!pImpl->initialized && method != Methods::Initialize) {
        return Envelope::MakeError(id, errors::makeError(JSONRPCErrorCodes::InvalidRequest,
                                                         "Server not initialized"));
    }
    auto builtin = ParseBuiltinMethod(method);
    if (!builtin.has_value()) {
        return Envelope::MakeError(id, errors::makeError(JSONRPCErrorCodes::MethodNotFound,
                                                         "Method not found: " + method));
    }

    JSONValue params = envelope.params.value_or(JSONValue{JSONValue::Object{}});
    try {
        return Envelope::MakeResult(id, pImpl->dispatch(builtin.value(), params));
    } catch (const errors::McpException& e) {
        LOG_DEBUG("Server: {} failed: {}", method, e.what());
        return Envelope::MakeError(id, e.error());
    } catch (const std::exception& e) {
        LOG_ERROR("Server: handler for {} threw: {}", method, e.what());
        return Envelope::MakeError(id, errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error",
                                                         JSONValue(std::string(e.what()))));
    } catch (...) {
        LOG_ERROR("Server: handler for {} threw a non-standard exception", method);
        return Envelope::MakeError(id, errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error",
                                                         JSONValue("unknown exception")));
    }
}

std::unique_ptr<IServer> ServerFactory::CreateServer(const Implementation& serverInfo) {
    return std::make_unique<Server>(serverInfo, registry);
}

} // namespace mcphub
