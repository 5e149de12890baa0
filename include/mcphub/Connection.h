//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: One logical link to a single server: handshake, discovery, background reader, teardown
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphub/CorrelationTable.h"
#include "mcphub/Protocol.h"
#include "mcphub/Transport.h"

namespace mcphub {

enum class ConnectionState {
    Disconnected,
    Connecting,
    AwaitingInitResponse,
    AwaitingInitializedAck,
    Discovering,
    Ready
};

const char* ConnectionStateName(ConnectionState state);

//==========================================================================================================
// Connection
// Purpose: Owns a transport, a correlation table and a reader thread for one server.
// Notes:
//   - State machine: Disconnected -> Connecting -> AwaitingInitResponse -> AwaitingInitializedAck ->
//     Discovering -> Ready, and back to Disconnected (terminal) on teardown from any state.
//   - The reader is started before `initialize` is sent so an immediate response cannot be lost.
//   - Teardown closes the transport, fails every pending call with ConnectionClosed and then runs the
//     closed handler. It happens once, from Close() or when the receive stream ends.
//==========================================================================================================
class Connection {
public:
    using NotificationHandler = std::function<void(const std::string& method, const JSONValue& params)>;
    using ClosedHandler = std::function<void(const std::string& serverName)>;

    struct Options {
        Implementation clientInfo{"mcphub", "1.0.0"};
        ClientCapabilities capabilities;
        std::chrono::milliseconds handshakeTimeout{10000};
    };

    Connection(std::string serverName, std::unique_ptr<ITransport> transport, Options opts);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    ///////////////////////////////////////// Lifecycle /////////////////////////////////////////
    //==========================================================================================================
    // Open
    // Purpose: Starts the transport, runs the initialize handshake and discovery; returns in Ready.
    // Throws:
    //   errors::McpException (ConnectFailed) when the transport cannot start, the server rejects
    //   initialize, the handshake times out, or the connection drops before Ready. The connection is
    //   Disconnected afterwards.
    //==========================================================================================================
    void Open();

    // Tears the connection down (idempotent) and joins the reader.
    void Close();

    ConnectionState GetState() const;
    const std::string& GetServerName() const;
    std::optional<Implementation> GetServerInfo() const;
    ServerCapabilities GetServerCapabilities() const;

    ///////////////////////////////////////// Discovery results /////////////////////////////////////////
    std::vector<std::shared_ptr<const Tool>> GetTools() const;
    std::vector<std::shared_ptr<const Resource>> GetResources() const;
    std::vector<std::shared_ptr<const Prompt>> GetPrompts() const;

    ///////////////////////////////////////// Requests /////////////////////////////////////////
    //==========================================================================================================
    // SendRequest
    // Purpose: Registers a pending call and writes the request.
    // Returns:
    //   The pending call; on a closed connection its slot is already failed with ConnectionClosed.
    // Throws:
    //   errors::McpException (TransportClosed) when the write fails; the pending call is removed.
    //==========================================================================================================
    CorrelationTable::PendingCall SendRequest(const std::string& method, std::optional<JSONValue> params);

    //==========================================================================================================
    // AwaitResult
    // Purpose: Waits up to timeout for a pending call's response.
    // Returns:
    //   The response's result member (an empty object when absent).
    // Throws:
    //   errors::McpException carrying the response error, ConnectionClosed, or Timeout. A timed out call
    //   is removed from the table; the connection stays open.
    //==========================================================================================================
    JSONValue AwaitResult(CorrelationTable::PendingCall call, std::chrono::milliseconds timeout,
                          const std::string& method);

    // SendRequest followed by AwaitResult.
    JSONValue Request(const std::string& method, std::optional<JSONValue> params,
                      std::chrono::milliseconds timeout);

    void SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    ///////////////////////////////////////// Handlers /////////////////////////////////////////
    void SetNotificationHandler(const std::string& method, NotificationHandler handler);
    void SetClosedHandler(ClosedHandler handler);

    std::size_t PendingCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphub
