//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_pipe_transport.cpp
// Purpose: PipeTransport child-process lifecycle, line framing and end-to-end client runs
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <signal.h>
#include <unistd.h>
#include "mcphub/Client.h"
#include "mcphub/PipeTransport.hpp"

using namespace mcphub;

namespace {

PipeTransport::Options catOptions() {
    PipeTransport::Options opts;
    opts.command = "/bin/cat";
    return opts;
}

} // namespace

TEST(PipeTransport, EchoesFramesThroughChild) {
    PipeTransport t(catOptions());
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_TRUE(t.IsConnected());
    EXPECT_GT(t.GetChildPid(), 0);

    JSONValue::Object params;
    SetMember(params, "text", JSONValue("multi\nline"));
    auto sent = Envelope::MakeRequest(JSONRPCId{int64_t{1}}, "echo", JSONValue{params});
    t.Send(sent);
    t.Send(Envelope::MakeNotification("second"));

    auto first = t.Receive();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->ok());
    EXPECT_EQ(first->envelope.value(), sent);
    auto second = t.Receive();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->envelope->method.value(), "second");

    t.Close().get();
    EXPECT_FALSE(t.Receive().has_value());
    EXPECT_THROW(t.Send(sent), errors::McpException);
}

TEST(PipeTransport, MissingExecutableFailsStart) {
    PipeTransport::Options opts;
    opts.command = "/nonexistent/definitely-not-a-server";
    PipeTransport t(opts);
    try {
        t.Start().get();
        FAIL() << "expected ConnectFailed";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ConnectFailed);
    }
    EXPECT_FALSE(t.IsConnected());
}

TEST(PipeTransport, ChildExitEndsReceive) {
    PipeTransport::Options opts;
    opts.command = "/bin/sh";
    opts.args = {"-c", "printf '{\"jsonrpc\":\"2.0\",\"method\":\"bye\"}'"};
    PipeTransport t(opts);
    t.Start().get();

    // Unterminated final line is still delivered at EOF
    auto r = t.Receive();
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->ok());
    EXPECT_EQ(r->envelope->method.value(), "bye");
    EXPECT_FALSE(t.Receive().has_value());
    EXPECT_FALSE(t.IsConnected());
}

TEST(PipeTransport, CloseReapsChild) {
    PipeTransport t(catOptions());
    t.Start().get();
    int pid = t.GetChildPid();
    ASSERT_GT(pid, 0);
    t.Close().get();
    EXPECT_EQ(::kill(pid, 0), -1);
}

TEST(PipeTransport, EnvironmentIsPassedToChild) {
    PipeTransport::Options opts;
    opts.command = "/bin/sh";
    opts.args = {"-c", "printf '{\"jsonrpc\":\"2.0\",\"method\":\"%s\"}\\n' \"$MCPHUB_TEST_VALUE\""};
    opts.env = {{"MCPHUB_TEST_VALUE", "from-parent"}};
    PipeTransport t(opts);
    t.Start().get();
    auto r = t.Receive();
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->ok());
    EXPECT_EQ(r->envelope->method.value(), "from-parent");
}

#ifdef MCPHUB_STDIO_SERVER_PATH
TEST(PipeEndToEnd, ClientReadsFileThroughStdioServer) {
    char path[] = "/tmp/mcphub_pipe_e2eXXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "hello";
    }

    ServerConfig cfg;
    cfg.transport = TransportKind::Pipe;
    cfg.command = MCPHUB_STDIO_SERVER_PATH;
    cfg.requestTimeout = std::chrono::seconds(5);
    cfg.handshakeTimeout = std::chrono::seconds(5);

    Client client(Implementation{"pipe-test", "1.0"});
    ASSERT_NO_THROW(client.ConnectServer("fs", cfg).get());
    EXPECT_TRUE(client.GetServerState("fs") == ConnectionState::Ready);

    auto tools = client.ListTools();
    EXPECT_NE(std::find(tools.begin(), tools.end(), "fs:read_file"), tools.end());

    JSONValue::Object args;
    SetMember(args, "path", JSONValue(std::string(path)));
    ToolResult result = client.CallTool("read_file", JSONValue{args}).get();
    ASSERT_EQ(CollectText(result).size(), 1u);
    EXPECT_EQ(CollectText(result)[0], "hello");

    JSONValue::Object addArgs;
    SetMember(addArgs, "a", JSONValue(2));
    SetMember(addArgs, "b", JSONValue(3.5));
    EXPECT_EQ(CollectText(client.CallTool("add", JSONValue{addArgs}).get())[0], "5.5");

    try {
        JSONValue::Object missing;
        SetMember(missing, "path", JSONValue("/nonexistent/nowhere.txt"));
        client.CallTool("read_file", JSONValue{missing}).get();
        FAIL() << "expected InternalError";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InternalError);
    }

    ASSERT_NO_THROW(client.Ping("fs").get());
    client.Shutdown().get();
    EXPECT_FALSE(client.GetServerState("fs").has_value());
    std::remove(path);
}
#endif
