//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON conversions for protocol structures
//==========================================================================================================

#include "mcphub/Protocol.h"
#include "logging/Logger.h"

namespace mcphub {

namespace {

JSONValue emptyObject() {
    return JSONValue{JSONValue::Object{}};
}

void setOptionalString(JSONValue::Object& obj, const char* key, const std::optional<std::string>& v) {
    if (v.has_value()) {
        SetMember(obj, key, JSONValue(v.value()));
    }
}

const JSONValue::Array* findArray(const JSONValue& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    if (v == nullptr || !v->isArray()) {
        return nullptr;
    }
    return &std::get<JSONValue::Array>(v->value);
}

} // namespace

JSONValue ImplementationToJSON(const Implementation& impl) {
    JSONValue::Object o;
    SetMember(o, "name", JSONValue(impl.name));
    SetMember(o, "version", JSONValue(impl.version));
    return JSONValue{std::move(o)};
}

std::optional<Implementation> ImplementationFromJSON(const JSONValue& v) {
    auto name = GetStringMember(v, "name");
    if (!name.has_value()) {
        return std::nullopt;
    }
    return Implementation{name.value(), GetStringMember(v, "version").value_or("")};
}

JSONValue ServerCapabilitiesToJSON(const ServerCapabilities& caps) {
    JSONValue::Object o;
    if (caps.tools.has_value()) {
        JSONValue::Object t;
        SetMember(t, "listChanged", JSONValue(caps.tools->listChanged));
        SetMember(o, "tools", JSONValue{std::move(t)});
    }
    if (caps.resources.has_value()) {
        JSONValue::Object r;
        SetMember(r, "subscribe", JSONValue(caps.resources->subscribe));
        SetMember(r, "listChanged", JSONValue(caps.resources->listChanged));
        SetMember(o, "resources", JSONValue{std::move(r)});
    }
    if (caps.prompts.has_value()) {
        JSONValue::Object p;
        SetMember(p, "listChanged", JSONValue(caps.prompts->listChanged));
        SetMember(o, "prompts", JSONValue{std::move(p)});
    }
    if (caps.logging.has_value()) {
        SetMember(o, "logging", emptyObject());
    }
    return JSONValue{std::move(o)};
}

// A category counts as advertised when its key is present and not false/null.
ServerCapabilities ServerCapabilitiesFromJSON(const JSONValue& v) {
    auto advertised = [&v](const char* key) -> const JSONValue* {
        const JSONValue* c = FindMember(v, key);
        if (c == nullptr || c->isNull()) {
            return nullptr;
        }
        if (std::holds_alternative<bool>(c->value) && !std::get<bool>(c->value)) {
            return nullptr;
        }
        return c;
    };
    ServerCapabilities caps;
    if (const JSONValue* t = advertised("tools")) {
        ToolsCapability tc;
        tc.listChanged = GetBoolMember(*t, "listChanged").value_or(false);
        caps.tools = tc;
    }
    if (const JSONValue* r = advertised("resources")) {
        ResourcesCapability rc;
        rc.subscribe = GetBoolMember(*r, "subscribe").value_or(false);
        rc.listChanged = GetBoolMember(*r, "listChanged").value_or(false);
        caps.resources = rc;
    }
    if (const JSONValue* p = advertised("prompts")) {
        PromptsCapability pc;
        pc.listChanged = GetBoolMember(*p, "listChanged").value_or(false);
        caps.prompts = pc;
    }
    if (advertised("logging") != nullptr) {
        caps.logging = LoggingCapability{};
    }
    return caps;
}

JSONValue ClientCapabilitiesToJSON(const ClientCapabilities& caps) {
    JSONValue::Object o;
    if (caps.roots) {
        JSONValue::Object r;
        SetMember(r, "listChanged", JSONValue(false));
        SetMember(o, "roots", JSONValue{std::move(r)});
    }
    if (caps.sampling) {
        SetMember(o, "sampling", emptyObject());
    }
    return JSONValue{std::move(o)};
}

JSONValue ContentToJSON(const Content& c) {
    JSONValue::Object o;
    SetMember(o, "type", JSONValue(c.type));
    if (c.type == "text" || !c.text.empty()) {
        SetMember(o, "text", JSONValue(c.text));
    }
    setOptionalString(o, "mimeType", c.mimeType);
    setOptionalString(o, "data", c.data);
    setOptionalString(o, "uri", c.uri);
    return JSONValue{std::move(o)};
}

std::optional<Content> ContentFromJSON(const JSONValue& v) {
    auto type = GetStringMember(v, "type");
    if (!type.has_value()) {
        return std::nullopt;
    }
    Content c;
    c.type = type.value();
    c.text = GetStringMember(v, "text").value_or("");
    c.mimeType = GetStringMember(v, "mimeType");
    c.data = GetStringMember(v, "data");
    c.uri = GetStringMember(v, "uri");
    return c;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object o;
    SetMember(o, "name", JSONValue(tool.name));
    SetMember(o, "description", JSONValue(tool.description));
    SetMember(o, "inputSchema", tool.inputSchema);
    return JSONValue{std::move(o)};
}

std::optional<Tool> ToolFromJSON(const JSONValue& v) {
    auto name = GetStringMember(v, "name");
    if (!name.has_value() || name->empty()) {
        return std::nullopt;
    }
    Tool t;
    t.name = name.value();
    t.description = GetStringMember(v, "description").value_or("");
    if (const JSONValue* s = FindMember(v, "inputSchema")) {
        t.inputSchema = *s;
    }
    return t;
}

JSONValue CallToolResultToJSON(const CallToolResult& r) {
    JSONValue::Array content;
    for (const auto& c : r.content) {
        content.push_back(std::make_shared<JSONValue>(ContentToJSON(c)));
    }
    JSONValue::Object o;
    SetMember(o, "content", JSONValue{std::move(content)});
    if (r.isError) {
        SetMember(o, "isError", JSONValue(true));
    }
    return JSONValue{std::move(o)};
}

std::optional<CallToolResult> CallToolResultFromJSON(const JSONValue& v) {
    const JSONValue::Array* arr = findArray(v, "content");
    if (arr == nullptr) {
        return std::nullopt;
    }
    CallToolResult r;
    for (const auto& item : *arr) {
        if (!item) {
            continue;
        }
        auto c = ContentFromJSON(*item);
        if (!c.has_value()) {
            LOG_DEBUG("CallToolResultFromJSON: skipping content item without type");
            continue;
        }
        r.content.push_back(std::move(c.value()));
    }
    r.isError = GetBoolMember(v, "isError").value_or(false);
    return r;
}

JSONValue ResourceToJSON(const Resource& r) {
    JSONValue::Object o;
    SetMember(o, "uri", JSONValue(r.uri));
    SetMember(o, "name", JSONValue(r.name));
    setOptionalString(o, "description", r.description);
    setOptionalString(o, "mimeType", r.mimeType);
    return JSONValue{std::move(o)};
}

std::optional<Resource> ResourceFromJSON(const JSONValue& v) {
    auto uri = GetStringMember(v, "uri");
    if (!uri.has_value() || uri->empty()) {
        return std::nullopt;
    }
    Resource r;
    r.uri = uri.value();
    r.name = GetStringMember(v, "name").value_or(r.uri);
    r.description = GetStringMember(v, "description");
    r.mimeType = GetStringMember(v, "mimeType");
    return r;
}

JSONValue ReadResourceResultToJSON(const ReadResourceResult& r) {
    JSONValue::Array contents;
    for (const auto& c : r.contents) {
        JSONValue::Object o;
        SetMember(o, "uri", JSONValue(c.uri));
        setOptionalString(o, "mimeType", c.mimeType);
        setOptionalString(o, "text", c.text);
        setOptionalString(o, "blob", c.blob);
        contents.push_back(std::make_shared<JSONValue>(JSONValue{std::move(o)}));
    }
    JSONValue::Object o;
    SetMember(o, "contents", JSONValue{std::move(contents)});
    return JSONValue{std::move(o)};
}

std::optional<ReadResourceResult> ReadResourceResultFromJSON(const JSONValue& v) {
    const JSONValue::Array* arr = findArray(v, "contents");
    if (arr == nullptr) {
        return std::nullopt;
    }
    ReadResourceResult r;
    for (const auto& item : *arr) {
        if (!item) {
            continue;
        }
        ResourceContents c;
        c.uri = GetStringMember(*item, "uri").value_or("");
        c.mimeType = GetStringMember(*item, "mimeType");
        c.text = GetStringMember(*item, "text");
        c.blob = GetStringMember(*item, "blob");
        r.contents.push_back(std::move(c));
    }
    return r;
}

JSONValue PromptToJSON(const Prompt& p) {
    JSONValue::Array args;
    for (const auto& a : p.arguments) {
        JSONValue::Object ao;
        SetMember(ao, "name", JSONValue(a.name));
        setOptionalString(ao, "description", a.description);
        SetMember(ao, "required", JSONValue(a.required));
        args.push_back(std::make_shared<JSONValue>(JSONValue{std::move(ao)}));
    }
    JSONValue::Object o;
    SetMember(o, "name", JSONValue(p.name));
    SetMember(o, "description", JSONValue(p.description));
    SetMember(o, "arguments", JSONValue{std::move(args)});
    return JSONValue{std::move(o)};
}

std::optional<Prompt> PromptFromJSON(const JSONValue& v) {
    auto name = GetStringMember(v, "name");
    if (!name.has_value() || name->empty()) {
        return std::nullopt;
    }
    Prompt p;
    p.name = name.value();
    p.description = GetStringMember(v, "description").value_or("");
    if (const JSONValue::Array* arr = findArray(v, "arguments")) {
        for (const auto& item : *arr) {
            if (!item) {
                continue;
            }
            auto argName = GetStringMember(*item, "name");
            if (!argName.has_value()) {
                continue;
            }
            PromptArgument a;
            a.name = argName.value();
            a.description = GetStringMember(*item, "description");
            a.required = GetBoolMember(*item, "required").value_or(false);
            p.arguments.push_back(std::move(a));
        }
    }
    return p;
}

JSONValue GetPromptResultToJSON(const GetPromptResult& r) {
    JSONValue::Array messages;
    for (const auto& m : r.messages) {
        JSONValue::Object mo;
        SetMember(mo, "role", JSONValue(m.role));
        SetMember(mo, "content", ContentToJSON(m.content));
        messages.push_back(std::make_shared<JSONValue>(JSONValue{std::move(mo)}));
    }
    JSONValue::Object o;
    SetMember(o, "description", JSONValue(r.description));
    SetMember(o, "messages", JSONValue{std::move(messages)});
    return JSONValue{std::move(o)};
}

std::optional<GetPromptResult> GetPromptResultFromJSON(const JSONValue& v) {
    const JSONValue::Array* arr = findArray(v, "messages");
    if (arr == nullptr) {
        return std::nullopt;
    }
    GetPromptResult r;
    r.description = GetStringMember(v, "description").value_or("");
    for (const auto& item : *arr) {
        if (!item) {
            continue;
        }
        PromptMessage m;
        m.role = GetStringMember(*item, "role").value_or("user");
        if (const JSONValue* c = FindMember(*item, "content")) {
            auto content = ContentFromJSON(*c);
            if (content.has_value()) {
                m.content = std::move(content.value());
            }
        }
        r.messages.push_back(std::move(m));
    }
    return r;
}

std::vector<std::string> CollectText(const CallToolResult& r) {
    std::vector<std::string> out;
    out.reserve(r.content.size());
    for (const auto& c : r.content) {
        if (c.type == "text") {
            out.push_back(c.text);
        }
    }
    return out;
}

} // namespace mcphub
