//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, JSON-RPC id type, error codes and JSON text conversion
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcphub {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Integers without fraction/exponent parse as int64_t; everything else numeric parses as double.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

// Deep structural equality (object member order is irrelevant; null shared_ptr equals JSON null).
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSON text conversion
//==========================================================================================================
//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document (trailing non-whitespace is an error).
// Args:
//   text: UTF-8 JSON text.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error describing the first syntax error and its offset.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact single-line serialization; control characters (including newlines) are escaped.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// Object member helpers
// Purpose: Null-safe lookups used when reading protocol payloads.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& obj, const std::string& key);
std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& obj, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& obj, const std::string& key);
void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue value);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Renders an id for diagnostics ("7", "\"abc\"", "null").
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus domain codes.
// Notes:
//   Codes in -32096..-32099 are raised locally by the client and never appear on the wire.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Domain error codes
    constexpr int ToolNotFound = -32000;
    constexpr int ResourceNotFound = -32001;
    constexpr int PromptNotFound = -32002;
    constexpr int CapabilityNotSupported = -32003;

    // Client-local codes
    constexpr int ConnectionClosed = -32099;
    constexpr int Timeout = -32098;
    constexpr int TransportClosed = -32097;
    constexpr int ConnectFailed = -32096;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
// Args:
//   code: Integer error code.
//   message: Human-readable description.
//   data: Optional structured payload.
// Returns:
//   JSONValue object representing the error.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcphub
