//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection_handshake.cpp
// Purpose: Connection handshake ordering, discovery, correlation, timeouts and teardown
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include "TestPeer.h"
#include "mcphub/Connection.h"

using namespace mcphub;
using mcphub::testpeer::MakeTool;
using mcphub::testpeer::ObjectWith;
using mcphub::testpeer::ScriptedPeer;

namespace {

Connection::Options fastOptions() {
    Connection::Options opts;
    opts.handshakeTimeout = std::chrono::milliseconds(500);
    return opts;
}

// Transport whose Start() always fails.
class RefusingTransport : public ITransport {
public:
    std::future<void> Start() override {
        std::promise<void> p;
        p.set_exception(std::make_exception_ptr(std::runtime_error("connection refused")));
        return p.get_future();
    }
    std::future<void> Close() override {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }
    bool IsConnected() const override { return false; }
    std::string GetSessionId() const override { return "refusing"; }
    void Send(const Envelope&) override {
        throw errors::McpException(JSONRPCErrorCodes::TransportClosed, "not connected");
    }
    std::optional<DecodeResult> Receive() override { return std::nullopt; }
};

} // namespace

TEST(ConnectionHandshake, InitializeThenAckThenDiscovery) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("read_file"), MakeTool("write_file")},
                      {Resource{"file:///a.txt", "a"}},
                      {Prompt{"summarize", "Summarize text"}});

    Connection conn("fs", std::move(clientEnd), fastOptions());
    ASSERT_NO_THROW(conn.Open());
    EXPECT_EQ(conn.GetState(), ConnectionState::Ready);

    auto methods = peer.ReceivedMethods();
    ASSERT_GE(methods.size(), 5u);
    EXPECT_EQ(methods[0], Methods::Initialize);
    EXPECT_EQ(methods[1], Methods::Initialized);
    EXPECT_EQ(methods[2], Methods::ListTools);
    EXPECT_EQ(methods[3], Methods::ListResources);
    EXPECT_EQ(methods[4], Methods::ListPrompts);

    auto init = peer.WaitForMessage(Methods::Initialize);
    ASSERT_TRUE(init.has_value());
    ASSERT_TRUE(init->params.has_value());
    EXPECT_EQ(GetStringMember(init->params.value(), "protocolVersion").value(), PROTOCOL_VERSION);
    ASSERT_NE(FindMember(init->params.value(), "clientInfo"), nullptr);

    ASSERT_EQ(conn.GetTools().size(), 2u);
    EXPECT_EQ(conn.GetTools()[0]->name, "read_file");
    ASSERT_EQ(conn.GetResources().size(), 1u);
    EXPECT_EQ(conn.GetResources()[0]->uri, "file:///a.txt");
    ASSERT_EQ(conn.GetPrompts().size(), 1u);
    ASSERT_TRUE(conn.GetServerInfo().has_value());
    EXPECT_EQ(conn.GetServerInfo()->name, "scripted");
}

TEST(ConnectionHandshake, OnlyAdvertisedCategoriesAreListed) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("only")});

    Connection conn("one", std::move(clientEnd), fastOptions());
    conn.Open();
    EXPECT_EQ(peer.CountMethod(Methods::ListTools), 1u);
    EXPECT_EQ(peer.CountMethod(Methods::ListResources), 0u);
    EXPECT_EQ(peer.CountMethod(Methods::ListPrompts), 0u);
    EXPECT_TRUE(conn.GetResources().empty());
}

TEST(ConnectionHandshake, InitializeErrorFailsConnectWithServerError) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.OnRequest(Methods::Initialize, [](const Envelope& req) {
        return std::optional<Envelope>(Envelope::MakeError(
            req.id, errors::makeError(JSONRPCErrorCodes::InvalidParams, "unsupported protocol")));
    });

    Connection conn("bad", std::move(clientEnd), fastOptions());
    try {
        conn.Open();
        FAIL() << "Open() should throw";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectFailed);
        ASSERT_TRUE(e.error().data.has_value());
        EXPECT_EQ(GetIntMember(e.error().data.value(), "code").value(), JSONRPCErrorCodes::InvalidParams);
    }
    EXPECT_EQ(conn.GetState(), ConnectionState::Disconnected);
    EXPECT_EQ(peer.CountMethod(Methods::Initialized), 0u);
}

TEST(ConnectionHandshake, UnansweredInitializeTimesOut) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));

    Connection::Options opts;
    opts.handshakeTimeout = std::chrono::milliseconds(100);
    Connection conn("silent", std::move(clientEnd), opts);
    try {
        conn.Open();
        FAIL() << "Open() should throw";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectFailed);
        ASSERT_TRUE(e.error().data.has_value());
        EXPECT_EQ(GetIntMember(e.error().data.value(), "code").value(), JSONRPCErrorCodes::Timeout);
    }
    EXPECT_EQ(conn.GetState(), ConnectionState::Disconnected);
}

TEST(ConnectionHandshake, TransportStartFailureIsConnectFailed) {
    Connection conn("down", std::make_unique<RefusingTransport>(), fastOptions());
    try {
        conn.Open();
        FAIL() << "Open() should throw";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ConnectFailed);
    }
    EXPECT_EQ(conn.GetState(), ConnectionState::Disconnected);
}

TEST(ConnectionHandshake, FailedListLeavesOnlyThatCategoryEmpty) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("t")}, {Resource{"mem://r", "r"}});
    peer.OnRequest(Methods::ListTools, [](const Envelope& req) {
        return std::optional<Envelope>(Envelope::MakeError(
            req.id, errors::makeError(JSONRPCErrorCodes::InternalError, "boom")));
    });

    Connection conn("partial", std::move(clientEnd), fastOptions());
    ASSERT_NO_THROW(conn.Open());
    EXPECT_EQ(conn.GetState(), ConnectionState::Ready);
    EXPECT_TRUE(conn.GetTools().empty());
    ASSERT_EQ(conn.GetResources().size(), 1u);
    EXPECT_EQ(conn.GetResources()[0]->uri, "mem://r");
}

TEST(ConnectionCorrelation, ResponsesInReverseOrderReachTheirCallers) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("t")});

    Connection conn("perm", std::move(clientEnd), fastOptions());
    conn.Open();

    std::vector<CorrelationTable::PendingCall> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(conn.SendRequest("slow/op", ObjectWith("n", JSONValue(i))));
    }
    std::vector<Envelope> requests;
    for (std::size_t i = 0; i < 3; ++i) {
        auto req = peer.WaitForMessage("slow/op", i);
        ASSERT_TRUE(req.has_value());
        requests.push_back(req.value());
    }
    for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
        const JSONValue* n = FindMember(it->params.value(), "n");
        peer.Send(Envelope::MakeResult(it->id.value(), ObjectWith("echo", *n)));
    }
    for (int i = 0; i < 3; ++i) {
        JSONValue result = conn.AwaitResult(std::move(calls[i]), std::chrono::seconds(2), "slow/op");
        EXPECT_EQ(GetIntMember(result, "echo").value(), i);
    }
    EXPECT_EQ(conn.PendingCount(), 0u);
}

TEST(ConnectionCorrelation, TimeoutRemovesCallAndConnectionStaysUsable) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("t")});
    peer.OnRequest("fast/op", [](const Envelope& req) {
        return std::optional<Envelope>(Envelope::MakeResult(req.id.value(), ObjectWith("ok", JSONValue(true))));
    });

    Connection conn("slow", std::move(clientEnd), fastOptions());
    conn.Open();

    auto call = conn.SendRequest("never/answered", std::nullopt);
    int64_t lateId = call.id;
    try {
        conn.AwaitResult(std::move(call), std::chrono::milliseconds(50), "never/answered");
        FAIL() << "expected timeout";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::Timeout);
    }
    EXPECT_EQ(conn.PendingCount(), 0u);
    EXPECT_EQ(conn.GetState(), ConnectionState::Ready);

    // Late reply for the abandoned id is dropped
    peer.Send(Envelope::MakeResult(JSONRPCId{lateId}, JSONValue{JSONValue::Object{}}));
    JSONValue r = conn.Request("fast/op", std::nullopt, std::chrono::seconds(2));
    EXPECT_EQ(GetBoolMember(r, "ok").value(), true);
}

TEST(ConnectionTeardown, PeerCloseFailsEveryPendingCall) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("t")});

    Connection conn("gone", std::move(clientEnd), fastOptions());
    std::promise<std::string> closedName;
    conn.SetClosedHandler([&closedName](const std::string& name) { closedName.set_value(name); });
    conn.Open();

    std::vector<CorrelationTable::PendingCall> calls;
    for (int i = 0; i < 3; ++i) {
        calls.push_back(conn.SendRequest("held/op", std::nullopt));
    }
    ASSERT_TRUE(peer.WaitForMessage("held/op", 2).has_value());
    EXPECT_EQ(conn.PendingCount(), 3u);

    peer.Close();

    for (auto& call : calls) {
        try {
            conn.AwaitResult(std::move(call), std::chrono::seconds(2), "held/op");
            FAIL() << "expected ConnectionClosed";
        } catch (const errors::McpException& e) {
            EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectionClosed);
        }
    }
    auto fut = closedName.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fut.get(), "gone");
    EXPECT_EQ(conn.GetState(), ConnectionState::Disconnected);
    EXPECT_EQ(conn.PendingCount(), 0u);
    EXPECT_TRUE(conn.GetTools().empty());

    // Requests after teardown fail without blocking
    auto late = conn.SendRequest("after/close", std::nullopt);
    EXPECT_THROW(conn.AwaitResult(std::move(late), std::chrono::seconds(1), "after/close"), errors::McpException);
}

TEST(ConnectionTeardown, CloseIsIdempotentAndHandlerRunsOnce) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("t")});

    Connection conn("twice", std::move(clientEnd), fastOptions());
    std::atomic<int> closes{0};
    conn.SetClosedHandler([&closes](const std::string&) { ++closes; });
    conn.Open();
    conn.Close();
    conn.Close();
    EXPECT_EQ(closes.load(), 1);
    EXPECT_EQ(conn.GetState(), ConnectionState::Disconnected);
}

TEST(ConnectionInbound, ServerPingIsAnsweredAndUnknownRequestRejected) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("t")});

    Connection conn("inbound", std::move(clientEnd), fastOptions());
    conn.Open();

    peer.Send(Envelope::MakeRequest(JSONRPCId{std::string("srv-1")}, Methods::Ping));
    auto pong = peer.WaitForResponse(JSONRPCId{std::string("srv-1")});
    ASSERT_TRUE(pong.has_value());
    EXPECT_TRUE(pong->result.has_value());

    peer.Send(Envelope::MakeRequest(JSONRPCId{std::string("srv-2")}, "sampling/createMessage"));
    auto rejected = peer.WaitForResponse(JSONRPCId{std::string("srv-2")});
    ASSERT_TRUE(rejected.has_value());
    ASSERT_TRUE(rejected->error.has_value());
    EXPECT_EQ(rejected->error->code, JSONRPCErrorCodes::MethodNotFound);
}

TEST(ConnectionInbound, NotificationsReachHandlerAndGarbageIsDropped) {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    ScriptedPeer peer(std::move(serverEnd));
    peer.ServeCatalog({MakeTool("t")});

    Connection conn("notify", std::move(clientEnd), fastOptions());
    std::promise<JSONValue> progress;
    conn.SetNotificationHandler(Methods::ProgressNotification,
                                [&progress](const std::string&, const JSONValue& params) {
                                    progress.set_value(params);
                                });
    conn.Open();

    peer.SendRaw("this is not json");
    peer.SendRaw(R"({"jsonrpc":"1.0","method":"bogus"})");
    peer.Send(Envelope::MakeNotification(Methods::ProgressNotification, ObjectWith("progress", JSONValue(50))));

    auto fut = progress.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(GetIntMember(fut.get(), "progress").value(), 50);
    EXPECT_EQ(conn.GetState(), ConnectionState::Ready);
}
