//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_websocket_transport.cpp
// Purpose: WebSocket transport over a loopback acceptor, and a client/server run across it
//==========================================================================================================

#include <gtest/gtest.h>
#include <cctype>
#include <chrono>
#include <future>
#include <thread>
#include "mcphub/Client.h"
#include "mcphub/Server.h"
#include "mcphub/WebSocketTransport.hpp"

using namespace mcphub;

namespace {

std::string loopbackUrl(unsigned short port) {
    return "ws://127.0.0.1:" + std::to_string(port) + "/mcp";
}

} // namespace

TEST(WebSocketTransport, ExchangesMessagesBothWays) {
    WebSocketAcceptor acceptor("127.0.0.1", 0);
    ASSERT_GT(acceptor.GetPort(), 0);
    auto accepted = std::async(std::launch::async, [&acceptor]() { return acceptor.Accept(); });

    WebSocketTransport::Options opts;
    opts.url = loopbackUrl(acceptor.GetPort());
    WebSocketTransport client(opts);
    ASSERT_NO_THROW(client.Start().get());
    ASSERT_EQ(accepted.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto server = accepted.get();
    server->Start().get();

    JSONValue::Object params;
    SetMember(params, "text", JSONValue("over the wire\n"));
    auto request = Envelope::MakeRequest(JSONRPCId{int64_t{1}}, "echo", JSONValue{params});
    client.Send(request);
    auto atServer = server->Receive();
    ASSERT_TRUE(atServer.has_value());
    ASSERT_TRUE(atServer->ok());
    EXPECT_EQ(atServer->envelope.value(), request);

    server->Send(Envelope::MakeResult(JSONRPCId{int64_t{1}}, JSONValue{params}));
    auto atClient = client.Receive();
    ASSERT_TRUE(atClient.has_value());
    ASSERT_TRUE(atClient->ok());
    EXPECT_TRUE(atClient->envelope->IsResponse());

    client.Close().get();
    EXPECT_FALSE(server->Receive().has_value());
    EXPECT_FALSE(client.Receive().has_value());
    EXPECT_THROW(client.Send(request), errors::McpException);
    server->Close().get();
}

TEST(WebSocketTransport, UnreachableEndpointIsConnectFailed) {
    WebSocketAcceptor probe("127.0.0.1", 0);
    unsigned short port = probe.GetPort();
    probe.Close();

    WebSocketTransport::Options opts;
    opts.url = loopbackUrl(port);
    opts.connectTimeout = std::chrono::milliseconds(2000);
    WebSocketTransport client(opts);
    try {
        client.Start().get();
        FAIL() << "expected ConnectFailed";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectFailed);
    }
}

TEST(WebSocketTransport, RejectsNonWebSocketUrl) {
    WebSocketTransport::Options opts;
    opts.url = "http://127.0.0.1:80/";
    WebSocketTransport client(opts);
    EXPECT_THROW(client.Start().get(), errors::McpException);
}

TEST(WebSocketEndToEnd, ClientCallsToolOnSocketServer) {
    WebSocketAcceptor acceptor("127.0.0.1", 0);
    auto registry = std::make_shared<ToolRegistry>();
    registry->RegisterTool(Tool{"shout", "Upper-cases text"}, [](const JSONValue& args, std::stop_token) {
        std::promise<ToolResult> p;
        std::string text = GetStringMember(args, "text").value_or("");
        for (auto& c : text) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        ToolResult r;
        r.content.push_back(Content::Text(text));
        p.set_value(r);
        return p.get_future();
    });
    Server server(Implementation{"ws-server", "1.0"}, registry);
    std::thread serve([&]() { server.Start(acceptor.Accept()).get(); });

    ServerConfig cfg;
    cfg.transport = TransportKind::WebSocket;
    cfg.url = loopbackUrl(acceptor.GetPort());
    Client client(Implementation{"ws-client", "1.0"});
    auto connected = client.ConnectServer("remote", cfg);
    serve.join();
    ASSERT_NO_THROW(connected.get());

    JSONValue::Object args;
    SetMember(args, "text", JSONValue("quiet"));
    ToolResult r = client.CallTool("shout", JSONValue{args}).get();
    ASSERT_EQ(CollectText(r).size(), 1u);
    EXPECT_EQ(CollectText(r)[0], "QUIET");

    client.DisconnectServer("remote").get();
    server.Wait();
    EXPECT_FALSE(server.IsRunning());
}
