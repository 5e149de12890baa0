//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.hpp
// Purpose: WebSocket transport (ws:// and wss://) using Boost.Beast; one envelope per text message
//==========================================================================================================
#pragma once

#include "mcphub/Transport.h"

#include <chrono>
#include <memory>
#include <string>

namespace mcphub {

class WebSocketAcceptor;

//==========================================================================================================
// WebSocketTransport
// Purpose: Client side of a socket connection to a server. Every envelope is carried as exactly one
//          WebSocket text message, so no additional framing is applied.
// Notes:
//   - wss:// verifies the peer against the system trust store (or caFile) unless verifyPeer is false,
//     and sends SNI for the URL host.
//   - Instances returned by WebSocketAcceptor::Accept() are already handshaken; Start() only begins
//     reading.
//==========================================================================================================
class WebSocketTransport : public ITransport {
public:
    struct Options {
        std::string url;                    // ws://host[:port]/path or wss://host[:port]/path
        std::string caFile;
        bool verifyPeer{true};
        std::chrono::milliseconds connectTimeout{10000};
        std::chrono::milliseconds closeTimeout{1000};
        std::size_t maxMessageSize{4 * 1024 * 1024};
    };

    explicit WebSocketTransport(const Options& opts);
    ~WebSocketTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const Envelope& envelope) override;
    std::optional<DecodeResult> Receive() override;

private:
    friend class WebSocketAcceptor;
    class Impl;
    explicit WebSocketTransport(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// WebSocketAcceptor
// Purpose: Listens on host:port and produces one server-side WebSocketTransport per accepted client.
// Notes:
//   Port 0 binds an ephemeral port; GetPort() reports the bound one.
//==========================================================================================================
class WebSocketAcceptor {
public:
    WebSocketAcceptor(const std::string& host, unsigned short port);
    ~WebSocketAcceptor();

    unsigned short GetPort() const;

    //==========================================================================================================
    // Blocks until a client connects and completes the WebSocket handshake.
    // Returns:
    //   A transport ready to Start().
    // Throws:
    //   errors::McpException (ConnectFailed) when accepting or the handshake fails.
    //==========================================================================================================
    std::unique_ptr<ITransport> Accept();

    void Close();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphub
