//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Envelope.h
// Purpose: The single JSON-RPC 2.0 wire message type with encode, decode and validation
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcphub/JSONRPCTypes.h"
#include "mcphub/errors/Errors.h"

namespace mcphub {

// JSON-RPC protocol tag carried by every envelope
constexpr const char* JSONRPC_VERSION = "2.0";

struct DecodeResult;

//==========================================================================================================
// Envelope
// Purpose: One wire message: request, notification, or response (success or error).
// Fields:
//   jsonrpc: Protocol tag; must equal "2.0" for a valid message.
//   id:      Correlation token. Present on requests and their responses; absent on notifications.
//   method:  Operation name. Present on requests and notifications only.
//   params:  Structured argument bag (object or array).
//   result:  Success payload; mutually exclusive with error.
//   error:   Failure payload { code, message, data? }.
// Notes:
//   A present-but-null id ("id": null) is distinct from an absent id and is preserved through
//   encode/decode.
//==========================================================================================================
class Envelope {
public:
    enum class Kind {
        Request,
        Notification,
        Response,
        Invalid
    };

    std::string jsonrpc = JSONRPC_VERSION;
    std::optional<JSONRPCId> id;
    std::optional<std::string> method;
    std::optional<JSONValue> params;
    std::optional<JSONValue> result;
    std::optional<errors::McpError> error;

    /////////////////////////////////////////// Builders ///////////////////////////////////////////
    static Envelope MakeRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt);
    static Envelope MakeNotification(std::string method, std::optional<JSONValue> params = std::nullopt);
    static Envelope MakeResult(JSONRPCId id, JSONValue result);
    static Envelope MakeError(std::optional<JSONRPCId> id, errors::McpError error);

    ////////////////////////////////////////// Classification //////////////////////////////////////////
    // Structural kind; does not check the protocol tag (see Validate).
    Kind GetKind() const;
    bool IsRequest() const { return GetKind() == Kind::Request; }
    bool IsNotification() const { return GetKind() == Kind::Notification; }
    bool IsResponse() const { return GetKind() == Kind::Response; }
    bool IsError() const { return error.has_value(); }

    //==========================================================================================================
    // Encode
    // Purpose: Serializes to compact single-line JSON (no raw newlines, safe for line framing).
    //==========================================================================================================
    std::string Encode() const;

    //==========================================================================================================
    // Decode
    // Purpose: Parses bytes into an Envelope. Total: never throws on malformed input.
    // Returns:
    //   DecodeResult holding either the envelope or a ParseError/InvalidRequest error value.
    //==========================================================================================================
    static DecodeResult Decode(const std::string& bytes);

    //==========================================================================================================
    // Validate
    // Purpose: Checks the protocol tag and the request/notification/response invariants.
    // Returns:
    //   std::nullopt when valid, otherwise an InvalidRequest error describing the violation.
    //==========================================================================================================
    static std::optional<errors::McpError> Validate(const Envelope& envelope);
};

bool operator==(const Envelope& a, const Envelope& b);
inline bool operator!=(const Envelope& a, const Envelope& b) { return !(a == b); }

//==========================================================================================================
// DecodeResult
// Purpose: Outcome of Envelope::Decode.
// Fields:
//   envelope: Set on success.
//   error:    Set on failure (ParseError for malformed JSON, InvalidRequest for bad structure).
//   id:       Best-effort request id recovered from a structurally invalid message, so a peer can
//             still be answered with an error response.
//==========================================================================================================
struct DecodeResult {
    std::optional<Envelope> envelope;
    std::optional<errors::McpError> error;
    std::optional<JSONRPCId> id;

    bool ok() const { return envelope.has_value(); }
};

} // namespace mcphub
