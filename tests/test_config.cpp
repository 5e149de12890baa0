//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: ServerConfig parsing, environment defaults and transport factory selection
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include "mcphub/Config.h"
#include "mcphub/PipeTransport.hpp"
#include "mcphub/Transport.h"
#include "mcphub/WebSocketTransport.hpp"

using namespace mcphub;

TEST(ServerConfig, ParsesPipeSpec) {
    auto cfg = ParseServerConfig("name=fs; transport=pipe; command=python3; args=server.py --root \"/tmp/my dir\"; "
                                 "env=A=1,B=two; cwd=/tmp; timeoutMs=5000; handshakeTimeoutMs=250");
    EXPECT_EQ(cfg.name, "fs");
    EXPECT_EQ(cfg.transport, TransportKind::Pipe);
    EXPECT_EQ(cfg.command, "python3");
    ASSERT_EQ(cfg.args.size(), 3u);
    EXPECT_EQ(cfg.args[0], "server.py");
    EXPECT_EQ(cfg.args[1], "--root");
    EXPECT_EQ(cfg.args[2], "/tmp/my dir");
    ASSERT_EQ(cfg.env.size(), 2u);
    EXPECT_EQ(cfg.env[0].first, "A");
    EXPECT_EQ(cfg.env[1].second, "two");
    EXPECT_EQ(cfg.cwd, "/tmp");
    EXPECT_EQ(cfg.requestTimeout.count(), 5000);
    EXPECT_EQ(cfg.handshakeTimeout.count(), 250);
}

TEST(ServerConfig, UrlImpliesWebSocket) {
    auto cfg = ParseServerConfig("url=wss://example.com/mcp; verifyPeer=false; caFile=/etc/ca.pem");
    EXPECT_EQ(cfg.transport, TransportKind::WebSocket);
    EXPECT_EQ(cfg.url, "wss://example.com/mcp");
    EXPECT_FALSE(cfg.verifyPeer);
    EXPECT_EQ(cfg.caFile, "/etc/ca.pem");
}

TEST(ServerConfig, RejectsMalformedSpecs) {
    EXPECT_THROW(ParseServerConfig("transport=pipe"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("transport=websocket"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("transport=carrier-pigeon; command=x"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("command=x; colour=blue"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("command=x; timeoutMs=-5"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("command=x; timeoutMs=soon"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("command=x; verifyPeer=maybe"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("command x"), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig("command=x; args=\"unbalanced"), std::invalid_argument);
}

TEST(ServerConfig, TimeoutDefaultsComeFromEnvironment) {
    ::setenv("MCPHUB_REQUEST_TIMEOUT_MS", "1234", 1);
    ::unsetenv("MCPHUB_HANDSHAKE_TIMEOUT_MS");
    ServerConfig cfg;
    EXPECT_EQ(cfg.requestTimeout.count(), 1234);
    EXPECT_EQ(cfg.handshakeTimeout.count(), 10000);
    ::unsetenv("MCPHUB_REQUEST_TIMEOUT_MS");
    EXPECT_EQ(ServerConfig{}.requestTimeout.count(), 30000);
}

TEST(ServerConfig, SplitArgsHandlesQuotesAndBlanks) {
    auto args = SplitArgs("  a  \"b c\"   \"\" d ");
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[0], "a");
    EXPECT_EQ(args[1], "b c");
    EXPECT_EQ(args[2], "");
    EXPECT_EQ(args[3], "d");
}

TEST(TransportFactory, BuildsTransportForEachKind) {
    TransportFactory factory;
    auto pipe = factory.CreateTransport("command=/bin/cat");
    ASSERT_NE(pipe, nullptr);
    EXPECT_NE(dynamic_cast<PipeTransport*>(pipe.get()), nullptr);
    EXPECT_FALSE(pipe->IsConnected());

    auto ws = factory.CreateTransport("url=ws://127.0.0.1:1/mcp");
    ASSERT_NE(ws, nullptr);
    EXPECT_NE(dynamic_cast<WebSocketTransport*>(ws.get()), nullptr);

    EXPECT_THROW(factory.CreateTransport("transport=pipe"), std::invalid_argument);
}
