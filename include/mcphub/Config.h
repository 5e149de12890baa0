//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Per-server connection configuration and its "key=value; ..." text form
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace mcphub {

enum class TransportKind {
    Pipe,
    WebSocket
};

//==========================================================================================================
// ServerConfig
// Purpose: Describes how to reach one server.
// Fields:
//   name:             Optional label; the Client keys connections by the name passed to ConnectServer.
//   transport:        Pipe (spawn child, newline-delimited stdio) or WebSocket (ws:// or wss://).
//   command/args/env/cwd: Child process spec for Pipe. env entries are added to the inherited env.
//   url:              WebSocket endpoint, e.g. "ws://127.0.0.1:8765/mcp".
//   caFile/verifyPeer: TLS settings for wss://.
//   requestTimeout:   Default timeout for calls (MCPHUB_REQUEST_TIMEOUT_MS, default 30000 ms).
//   handshakeTimeout: Per-step timeout for initialize and discovery (MCPHUB_HANDSHAKE_TIMEOUT_MS,
//                     default 10000 ms).
//==========================================================================================================
struct ServerConfig {
    std::string name;
    TransportKind transport = TransportKind::Pipe;
    std::string command;
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> env;
    std::string cwd;
    std::string url;
    std::string caFile;
    bool verifyPeer = true;
    std::chrono::milliseconds requestTimeout;
    std::chrono::milliseconds handshakeTimeout;

    ServerConfig();
};

//==========================================================================================================
// ParseServerConfig
// Purpose: Parses "transport=pipe; command=python3; args=server.py --stdio; env=A=1,B=2; timeoutMs=5000".
// Keys:
//   name, transport (pipe|stdio|websocket|ws), command, args (whitespace separated, double quotes group),
//   env (comma separated K=V), cwd, url, caFile, verifyPeer (true|false), timeoutMs, handshakeTimeoutMs.
//   When transport is omitted it is inferred: url present -> websocket, otherwise pipe.
// Throws:
//   std::invalid_argument on unknown keys, malformed values, or missing command/url.
//==========================================================================================================
ServerConfig ParseServerConfig(const std::string& text);

// Splits a command line into arguments; double quotes group words.
std::vector<std::string> SplitArgs(const std::string& text);

} // namespace mcphub
