//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelope.cpp
// Purpose: Envelope builders, JSON encoding/decoding and structural validation
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcphub/Envelope.h"

namespace mcphub {

namespace {

JSONValue idToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}

// Returns false when the JSON value cannot be a JSON-RPC id (bool, double, object, array).
bool idFromJSON(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(v.value)) {
        out = std::get<std::string>(v.value);
        return true;
    }
    if (std::holds_alternative<int64_t>(v.value)) {
        out = std::get<int64_t>(v.value);
        return true;
    }
    if (v.isNull()) {
        out = nullptr;
        return true;
    }
    return false;
}

DecodeResult decodeFailure(int code, const std::string& message, std::optional<JSONRPCId> id = std::nullopt) {
    DecodeResult r;
    r.error = errors::makeError(code, message);
    r.id = std::move(id);
    return r;
}

} // namespace

Envelope Envelope::MakeRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params) {
    Envelope e;
    e.id = std::move(id);
    e.method = std::move(method);
    e.params = std::move(params);
    return e;
}

Envelope Envelope::MakeNotification(std::string method, std::optional<JSONValue> params) {
    Envelope e;
    e.method = std::move(method);
    e.params = std::move(params);
    return e;
}

Envelope Envelope::MakeResult(JSONRPCId id, JSONValue result) {
    Envelope e;
    e.id = std::move(id);
    e.result = std::move(result);
    return e;
}

Envelope Envelope::MakeError(std::optional<JSONRPCId> id, errors::McpError error) {
    Envelope e;
    // JSON-RPC answers unidentifiable requests with id null
    e.id = id.has_value() ? std::move(id) : std::optional<JSONRPCId>(JSONRPCId{nullptr});
    e.error = std::move(error);
    return e;
}

Envelope::Kind Envelope::GetKind() const {
    if (method.has_value()) {
        if (result.has_value() || error.has_value()) {
            return Kind::Invalid;
        }
        return id.has_value() ? Kind::Request : Kind::Notification;
    }
    if (result.has_value() != error.has_value() && id.has_value()) {
        return Kind::Response;
    }
    return Kind::Invalid;
}

std::string Envelope::Encode() const {
    FUNC_SCOPE();
    std::string out = "{\"jsonrpc\":" + SerializeJSON(JSONValue(jsonrpc));
    if (id.has_value()) {
        out += ",\"id\":" + SerializeJSON(idToJSON(id.value()));
    }
    if (method.has_value()) {
        out += ",\"method\":" + SerializeJSON(JSONValue(method.value()));
    }
    if (params.has_value()) {
        out += ",\"params\":" + SerializeJSON(params.value());
    }
    if (result.has_value()) {
        out += ",\"result\":" + SerializeJSON(result.value());
    }
    if (error.has_value()) {
        out += ",\"error\":" + SerializeJSON(errors::makeErrorValue(error.value()));
    }
    out += "}";
    return out;
}

DecodeResult Envelope::Decode(const std::string& bytes) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(bytes);
    } catch (const std::runtime_error& e) {
        return decodeFailure(JSONRPCErrorCodes::ParseError, std::string("Parse error: ") + e.what());
    }
    if (!doc.isObject()) {
        return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Message must be a JSON object");
    }

    Envelope env;
    std::optional<JSONRPCId> recoveredId;
    if (const JSONValue* idVal = FindMember(doc, "id")) {
        JSONRPCId id;
        if (!idFromJSON(*idVal, id)) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "Invalid id type");
        }
        env.id = id;
        recoveredId = id;
    }

    if (const JSONValue* v = FindMember(doc, "jsonrpc")) {
        if (!v->isString()) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "jsonrpc must be a string", recoveredId);
        }
        env.jsonrpc = std::get<std::string>(v->value);
    } else {
        env.jsonrpc.clear();
    }

    if (const JSONValue* v = FindMember(doc, "method")) {
        if (!v->isString()) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "method must be a string", recoveredId);
        }
        env.method = std::get<std::string>(v->value);
    }
    if (const JSONValue* v = FindMember(doc, "params")) {
        env.params = *v;
    }
    if (const JSONValue* v = FindMember(doc, "result")) {
        env.result = *v;
    }
    if (const JSONValue* v = FindMember(doc, "error")) {
        auto err = errors::mcpErrorFromErrorValue(*v);
        if (!err.has_value()) {
            return decodeFailure(JSONRPCErrorCodes::InvalidRequest, "error must be an object with integer code and string message", recoveredId);
        }
        env.error = std::move(err);
    }

    DecodeResult r;
    r.id = std::move(recoveredId);
    r.envelope = std::move(env);
    return r;
}

std::optional<errors::McpError> Envelope::Validate(const Envelope& envelope) {
    auto invalid = [](const char* why) {
        return std::optional<errors::McpError>(errors::makeError(JSONRPCErrorCodes::InvalidRequest, why));
    };
    if (envelope.jsonrpc != JSONRPC_VERSION) {
        return invalid("Invalid JSON-RPC version");
    }
    if (envelope.method.has_value()) {
        if (envelope.result.has_value() || envelope.error.has_value()) {
            return invalid("Request cannot have result or error");
        }
        if (envelope.method->empty()) {
            return invalid("Method must not be empty");
        }
        if (envelope.params.has_value() && !envelope.params->isObject() && !envelope.params->isArray()) {
            return invalid("params must be an object or array");
        }
        return std::nullopt;
    }
    if (envelope.result.has_value() || envelope.error.has_value()) {
        if (!envelope.id.has_value()) {
            return invalid("Response must have id");
        }
        if (envelope.result.has_value() && envelope.error.has_value()) {
            return invalid("Response cannot have both result and error");
        }
        return std::nullopt;
    }
    return invalid("Message must be either request or response");
}

bool operator==(const Envelope& a, const Envelope& b) {
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.method == b.method &&
           a.params == b.params && a.result == b.result && a.error == b.error;
}

} // namespace mcphub
