//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - message-oriented duplex channels carrying Envelopes
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <future>

#include "mcphub/Envelope.h"

namespace mcphub {

struct ServerConfig;

//==========================================================================================================
// Transport interface
// Purpose: One duplex channel to a single peer. Each Envelope travels as exactly one frame
//          (one line for pipe/stdio variants, one message for the WebSocket variant).
// Notes:
//   - Send() may be called from any thread, concurrently with a thread blocked in Receive().
//   - Receive() is a finite, non-restartable sequence: it returns std::nullopt exactly once the peer
//     has closed or Close() was called, and keeps returning std::nullopt afterwards.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Opens the transport (spawns the child process, connects the socket, ...).
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the channel is usable, or holds an errors::McpException with
    //   category ConnectFailed.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources; unblocks any pending Receive(). Idempotent.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message exchange ///////////////////////////////////////////
    //==========================================================================================================
    // Sends one envelope as one frame.
    // Args:
    //   envelope: Message to encode and write.
    // Throws:
    //   errors::McpException (TransportClosed) when the channel is closed or the write fails.
    //==========================================================================================================
    virtual void Send(const Envelope& envelope) = 0;

    //==========================================================================================================
    // Blocks until the next frame arrives and decodes it.
    // Returns:
    //   DecodeResult for the frame (a malformed frame yields a DecodeResult carrying an error, never an
    //   exception), or std::nullopt when the stream has ended.
    //==========================================================================================================
    virtual std::optional<DecodeResult> Receive() = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: "key=value; key=value" configuration string (see ParseServerConfig).
    // Returns:
    //   A unique_ptr to a newly created ITransport (not yet started).
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

//==========================================================================================================
// TransportFactory
// Purpose: Default factory: builds a PipeTransport or WebSocketTransport from a ServerConfig.
//==========================================================================================================
class TransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config);
};

} // namespace mcphub
