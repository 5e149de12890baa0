//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: Multi-server client routing, aggregate indices, collisions, disconnects and timeouts
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <random>
#include "TestPeer.h"
#include "mcphub/Client.h"
#include "mcphub/Server.h"

using namespace mcphub;
using mcphub::testpeer::MakeTool;
using mcphub::testpeer::ObjectWith;
using mcphub::testpeer::ScriptedPeer;

namespace {

ToolHandler replyWith(const std::string& text) {
    return [text](const JSONValue&, std::stop_token) {
        std::promise<ToolResult> p;
        ToolResult r;
        r.content.push_back(Content::Text(text));
        p.set_value(r);
        return p.get_future();
    };
}

std::unique_ptr<Server> makeServer(const std::string& name, const std::vector<std::pair<std::string, std::string>>& tools) {
    auto server = std::make_unique<Server>(Implementation{name, "1.0"});
    for (const auto& [tool, reply] : tools) {
        server->GetToolRegistry()->RegisterTool(Tool{tool, tool}, replyWith(reply));
    }
    return server;
}

// Starts server on one end of a fresh pair and returns the other end for the client.
std::unique_ptr<InMemoryTransport> serve(Server& server) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    server.Start(std::move(serverEnd)).get();
    return std::move(clientEnd);
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::string firstText(const ToolResult& r) {
    auto texts = CollectText(r);
    return texts.empty() ? std::string() : texts[0];
}

} // namespace

TEST(Client, RoutesEachToolToItsServer) {
    auto fs = makeServer("fs", {{"read_file", "hello"}});
    auto math = makeServer("math", {{"add", "3"}});
    Client client(Implementation{"test-client", "1.0"});
    ASSERT_NO_THROW(client.ConnectServer("fs", serve(*fs)).get());
    ASSERT_NO_THROW(client.ConnectServer("math", serve(*math)).get());

    auto servers = client.ListConnectedServers();
    EXPECT_EQ(servers.size(), 2u);
    auto tools = client.ListTools();
    EXPECT_TRUE(contains(tools, "fs:read_file"));
    EXPECT_TRUE(contains(tools, "math:add"));

    EXPECT_EQ(firstText(client.CallTool("read_file", ObjectWith("path", JSONValue("/tmp/x"))).get()), "hello");
    EXPECT_EQ(firstText(client.CallTool("add", JSONValue{JSONValue::Object{}}).get()), "3");

    auto available = client.GetAvailableTools();
    ASSERT_EQ(available.size(), 2u);
    EXPECT_EQ(available[0].server, "fs");
    EXPECT_EQ(available[0].tool.name, "read_file");
}

TEST(Client, ToolCallGoesOnTheWireAsToolsCall) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("read_file")});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("fs", std::move(clientEnd)).get();
    EXPECT_EQ(client.ListTools(), std::vector<std::string>{"fs:read_file"});

    auto fut = client.CallTool("read_file", ObjectWith("path", JSONValue("/tmp/x")));
    auto req = peer.WaitForMessage(Methods::CallTool, 0);
    ASSERT_TRUE(req.has_value());
    EXPECT_TRUE(req->IsRequest());
    EXPECT_EQ(req->method.value(), "tools/call");
    ASSERT_TRUE(req->params.has_value());
    EXPECT_EQ(GetStringMember(req->params.value(), "name").value_or(""), "read_file");
    const JSONValue* args = FindMember(req->params.value(), "arguments");
    ASSERT_NE(args, nullptr);
    EXPECT_EQ(*args, ObjectWith("path", JSONValue("/tmp/x")));

    peer.Send(Envelope::MakeResult(req->id.value(), ParseJSON(R"({"content":[{"type":"text","text":"hello"}]})")));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ToolResult result = fut.get();
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].type, "text");
    EXPECT_EQ(result.content[0].text, "hello");
}

TEST(Client, UnknownToolFailsWithoutSending) {
    auto fs = makeServer("fs", {{"read_file", "hello"}});
    Client client(Implementation{"test-client", "1.0"});
    auto clientEnd = serve(*fs);
    InMemoryTransport* wire = clientEnd.get();
    client.ConnectServer("fs", std::move(clientEnd)).get();

    std::size_t before = wire->SentCount();
    auto fut = client.CallTool("delete_everything", JSONValue{JSONValue::Object{}});
    try {
        fut.get();
        FAIL() << "expected ToolNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ToolNotFound);
    }
    EXPECT_EQ(wire->SentCount(), before);
}

TEST(Client, NameCollisionFirstRegisteredWins) {
    auto first = makeServer("a", {{"echo", "from-a"}});
    auto second = makeServer("b", {{"echo", "from-b"}});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("a", serve(*first)).get();
    client.ConnectServer("b", serve(*second)).get();

    auto tools = client.ListTools();
    EXPECT_TRUE(contains(tools, "a:echo"));
    EXPECT_TRUE(contains(tools, "b:echo"));
    EXPECT_EQ(firstText(client.CallTool("echo", JSONValue{JSONValue::Object{}}).get()), "from-a");

    // Removing the owner exposes the shadowed entry
    client.DisconnectServer("a").get();
    EXPECT_FALSE(contains(client.ListTools(), "a:echo"));
    EXPECT_EQ(firstText(client.CallTool("echo", JSONValue{JSONValue::Object{}}).get()), "from-b");
}

TEST(Client, ResourcesAndPromptsRouteToOwner) {
    auto docs = makeServer("docs", {});
    docs->RegisterResource(Resource{"docs://readme", "readme"}, [](const std::string& uri, std::stop_token) {
        std::promise<ReadResourceResult> p;
        ReadResourceResult r;
        r.contents.push_back(ResourceContents{uri, std::nullopt, std::string("# Readme"), std::nullopt});
        p.set_value(r);
        return p.get_future();
    });
    docs->RegisterPrompt(Prompt{"review", "Review code"}, [](const JSONValue& args) {
        GetPromptResult r;
        r.description = "review";
        r.messages.push_back(PromptMessage{"user", Content::Text("Review " + GetStringMember(args, "file").value_or(""))});
        return r;
    });
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("docs", serve(*docs)).get();

    EXPECT_TRUE(contains(client.ListResources(), "docs:docs://readme"));
    EXPECT_TRUE(contains(client.ListPrompts(), "docs:review"));
    ASSERT_EQ(client.GetAvailableResources().size(), 1u);
    ASSERT_EQ(client.GetAvailablePrompts().size(), 1u);

    auto read = client.ReadResource("docs://readme").get();
    ASSERT_EQ(read.contents.size(), 1u);
    EXPECT_EQ(read.contents[0].text.value(), "# Readme");

    auto prompt = client.GetPrompt("review", ObjectWith("file", JSONValue("main.cpp"))).get();
    ASSERT_EQ(prompt.messages.size(), 1u);
    EXPECT_EQ(prompt.messages[0].content.text, "Review main.cpp");

    try {
        client.ReadResource("docs://missing").get();
        FAIL() << "expected ResourceNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ResourceNotFound);
    }
    try {
        client.GetPrompt("missing", JSONValue{JSONValue::Object{}}).get();
        FAIL() << "expected PromptNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::PromptNotFound);
    }
}

TEST(Client, ServerErrorIsDeliveredThroughFuture) {
    auto srv = makeServer("srv", {});
    srv->GetToolRegistry()->RegisterTool(Tool{"fail", "fails"}, [](const JSONValue&, std::stop_token) -> std::future<ToolResult> {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "path is required");
    });
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("srv", serve(*srv)).get();
    try {
        client.CallTool("fail", JSONValue{JSONValue::Object{}}).get();
        FAIL() << "expected InvalidParams";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(std::string(e.what()), "path is required");
    }
}

TEST(Client, PeerDisconnectPurgesItemsAndFailsPendingCalls) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("slow"), MakeTool("other")});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("flaky", std::move(clientEnd)).get();
    ASSERT_EQ(client.ListTools().size(), 2u);

    std::vector<std::future<ToolResult>> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(client.CallTool("slow", JSONValue{JSONValue::Object{}}, std::chrono::seconds(5)));
    }
    ASSERT_TRUE(peer.WaitForMessage(Methods::CallTool, 2).has_value());
    peer.Close();

    for (auto& f : calls) {
        ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        try {
            f.get();
            FAIL() << "expected ConnectionClosed";
        } catch (const errors::McpException& e) {
            EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectionClosed);
        }
    }
    EXPECT_TRUE(client.ListTools().empty());
    EXPECT_TRUE(client.ListConnectedServers().empty());
    EXPECT_TRUE(client.GetServerState("flaky") == ConnectionState::Disconnected);

    try {
        client.CallTool("slow", JSONValue{JSONValue::Object{}}).get();
        FAIL() << "expected ToolNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ToolNotFound);
    }
}

TEST(Client, DisconnectServerFailsOutstandingCalls) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("slow")});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("busy", std::move(clientEnd)).get();

    std::vector<std::future<ToolResult>> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(client.CallTool("slow", JSONValue{JSONValue::Object{}}, std::chrono::seconds(5)));
    }
    ASSERT_TRUE(peer.WaitForMessage(Methods::CallTool, 2).has_value());

    client.DisconnectServer("busy").get();
    EXPECT_TRUE(client.ListTools().empty());
    EXPECT_FALSE(client.GetServerState("busy").has_value());
    for (auto& f : calls) {
        ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        try {
            f.get();
            FAIL() << "expected ConnectionClosed";
        } catch (const errors::McpException& e) {
            EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectionClosed);
        }
    }
}

TEST(Client, ConcurrentCallsMatchPermutedResponses) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("slow")});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("held", std::move(clientEnd)).get();

    constexpr int kCalls = 8;
    std::vector<std::future<ToolResult>> calls;
    for (int i = 0; i < kCalls; ++i) {
        calls.push_back(client.CallTool("slow", ObjectWith("n", JSONValue(i)), std::chrono::seconds(5)));
    }
    std::vector<Envelope> requests;
    for (int i = 0; i < kCalls; ++i) {
        auto req = peer.WaitForMessage(Methods::CallTool, static_cast<std::size_t>(i));
        ASSERT_TRUE(req.has_value());
        requests.push_back(*req);
    }

    std::mt19937 rng(20240611);
    std::shuffle(requests.begin(), requests.end(), rng);
    for (const auto& req : requests) {
        const JSONValue* args = FindMember(req.params.value(), "arguments");
        ASSERT_NE(args, nullptr);
        ToolResult r;
        r.content.push_back(Content::Text("n=" + std::to_string(GetIntMember(*args, "n").value_or(-1))));
        peer.Send(Envelope::MakeResult(req.id.value(), CallToolResultToJSON(r)));
    }

    for (int i = 0; i < kCalls; ++i) {
        EXPECT_EQ(firstText(calls[i].get()), "n=" + std::to_string(i));
    }
}

TEST(Client, PerCallTimeout) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("stuck")});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("slow", std::move(clientEnd)).get();

    auto fut = client.CallTool("stuck", JSONValue{JSONValue::Object{}}, std::chrono::milliseconds(50));
    try {
        fut.get();
        FAIL() << "expected Timeout";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::Timeout);
    }
    EXPECT_TRUE(client.GetServerState("slow") == ConnectionState::Ready);
}

TEST(Client, ConnectFailureLeavesNoRecord) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.OnRequest(Methods::Initialize, [](const Envelope& req) {
        return std::optional<Envelope>(Envelope::MakeError(
            req.id, errors::makeError(JSONRPCErrorCodes::InternalError, "not today")));
    });
    Client client(Implementation{"test-client", "1.0"});
    try {
        client.ConnectServer("broken", std::move(clientEnd)).get();
        FAIL() << "expected ConnectFailed";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectFailed);
    }
    EXPECT_FALSE(client.GetServerState("broken").has_value());
    EXPECT_TRUE(client.ListTools().empty());
}

TEST(Client, BadConfigIsConnectFailed) {
    Client client(Implementation{"test-client", "1.0"});
    ServerConfig cfg;
    cfg.transport = TransportKind::Pipe;
    cfg.command = "/nonexistent/server-binary";
    try {
        client.ConnectServer("ghost", cfg).get();
        FAIL() << "expected ConnectFailed";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectFailed);
    }
    EXPECT_FALSE(client.GetServerState("ghost").has_value());
}

TEST(Client, ReconnectReplacesPreviousConnection) {
    auto v1 = makeServer("v1", {{"version", "one"}});
    auto v2 = makeServer("v2", {{"version", "two"}, {"extra", "x"}});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("svc", serve(*v1)).get();
    EXPECT_EQ(firstText(client.CallTool("version", JSONValue{JSONValue::Object{}}).get()), "one");

    client.ConnectServer("svc", serve(*v2)).get();
    EXPECT_EQ(client.ListTools().size(), 2u);
    EXPECT_EQ(firstText(client.CallTool("version", JSONValue{JSONValue::Object{}}).get()), "two");
    v1->Wait();
    EXPECT_FALSE(v1->IsRunning());
}

TEST(Client, NotificationHandlerAppliesToConnections) {
    auto srv = makeServer("srv", {{"t", "ok"}});
    Client client(Implementation{"test-client", "1.0"});
    std::promise<std::string> got;
    client.SetNotificationHandler(Methods::ProgressNotification, [&got](const std::string&, const JSONValue& params) {
        got.set_value(GetStringMember(params, "message").value_or(""));
    });
    client.ConnectServer("srv", serve(*srv)).get();

    srv->SendNotification(Methods::ProgressNotification, ObjectWith("message", JSONValue("halfway")));
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fut.get(), "halfway");
}

TEST(Client, PingAndShutdown) {
    auto srv = makeServer("srv", {{"t", "ok"}});
    Client client(Implementation{"test-client", "1.0"});
    client.ConnectServer("srv", serve(*srv)).get();
    EXPECT_NO_THROW(client.Ping("srv").get());
    EXPECT_THROW(client.Ping("nobody").get(), errors::McpException);

    client.Shutdown().get();
    client.Shutdown().get();
    EXPECT_TRUE(client.ListConnectedServers().empty());
    EXPECT_TRUE(client.ListTools().empty());
    EXPECT_THROW(client.CallTool("t", JSONValue{JSONValue::Object{}}).get(), errors::McpException);
    srv->Wait();
}

TEST(Client, FactoryCreatesClient) {
    ClientFactory factory;
    auto client = factory.CreateClient(Implementation{"factory", "1.0"});
    ASSERT_NE(client, nullptr);
    EXPECT_TRUE(client->ListConnectedServers().empty());
}
