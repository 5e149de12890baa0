//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: ToolRegistry registration, lookup, invocation and schema builders
//==========================================================================================================

#include <gtest/gtest.h>
#include <future>
#include "mcphub/ToolRegistry.h"
#include "mcphub/errors/Errors.h"

using namespace mcphub;

namespace {

ToolHandler constant(const std::string& text) {
    return [text](const JSONValue&, std::stop_token) {
        std::promise<ToolResult> p;
        ToolResult r;
        r.content.push_back(Content::Text(text));
        p.set_value(r);
        return p.get_future();
    };
}

} // namespace

TEST(ToolRegistry, ListsInRegistrationOrder) {
    ToolRegistry registry;
    registry.RegisterTool(Tool{"zeta", "z"}, constant("z"));
    registry.RegisterTool(Tool{"alpha", "a"}, constant("a"));
    registry.RegisterTool(Tool{"mid", "m"}, constant("m"));

    auto tools = registry.ListTools();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_EQ(tools[2].name, "mid");
}

TEST(ToolRegistry, ReRegisterReplacesInPlace) {
    ToolRegistry registry;
    registry.RegisterTool(Tool{"a", "first"}, constant("one"));
    registry.RegisterTool(Tool{"b", "b"}, constant("b"));
    registry.RegisterTool(Tool{"a", "second"}, constant("two"));

    EXPECT_EQ(registry.Size(), 2u);
    auto tools = registry.ListTools();
    EXPECT_EQ(tools[0].name, "a");
    EXPECT_EQ(tools[0].description, "second");
    EXPECT_EQ(CollectText(registry.CallTool("a", JSONValue{JSONValue::Object{}}).get())[0], "two");
}

TEST(ToolRegistry, UnregisterAndLookup) {
    ToolRegistry registry;
    registry.RegisterTool(Tool{"a", "a"}, constant("a"));
    EXPECT_TRUE(registry.HasTool("a"));
    ASSERT_TRUE(registry.GetTool("a").has_value());
    EXPECT_TRUE(registry.UnregisterTool("a"));
    EXPECT_FALSE(registry.UnregisterTool("a"));
    EXPECT_FALSE(registry.HasTool("a"));
    EXPECT_FALSE(registry.GetTool("a").has_value());
    EXPECT_TRUE(registry.ListTools().empty());
}

TEST(ToolRegistry, UnknownToolThrowsToolNotFound) {
    ToolRegistry registry;
    try {
        registry.CallTool("missing", JSONValue{JSONValue::Object{}});
        FAIL() << "expected ToolNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ToolNotFound);
    }
}

TEST(ToolRegistry, RejectsEmptyNameOrHandler) {
    ToolRegistry registry;
    EXPECT_THROW(registry.RegisterTool(Tool{"", "nameless"}, constant("x")), std::invalid_argument);
    EXPECT_THROW(registry.RegisterTool(Tool{"x", "no handler"}, ToolHandler{}), std::invalid_argument);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ToolRegistry, ArgumentsAndStopTokenReachHandler) {
    ToolRegistry registry;
    registry.RegisterTool(Tool{"inspect", "i"}, [](const JSONValue& args, std::stop_token st) {
        std::promise<ToolResult> p;
        ToolResult r;
        r.content.push_back(Content::Text(GetStringMember(args, "path").value_or("")));
        r.isError = st.stop_requested();
        p.set_value(r);
        return p.get_future();
    });
    JSONValue::Object args;
    SetMember(args, "path", JSONValue("/tmp/x"));
    std::stop_source source;
    source.request_stop();
    ToolResult r = registry.CallTool("inspect", JSONValue{args}, source.get_token()).get();
    EXPECT_EQ(CollectText(r)[0], "/tmp/x");
    EXPECT_TRUE(r.isError);
}

TEST(ToolSchema, BuildersProduceJsonSchemaShapes) {
    JSONValue::Object props;
    props["path"] = std::make_shared<JSONValue>(schema::StringParameter("File path"));
    props["count"] = std::make_shared<JSONValue>(schema::NumberParameter("How many", 1.0, 10.0));
    props["force"] = std::make_shared<JSONValue>(schema::BooleanParameter("Overwrite"));
    props["tags"] = std::make_shared<JSONValue>(schema::ArrayParameter("Tags", schema::StringParameter("tag")));
    JSONValue s = schema::ToolSchema("Write a file", props, {"path"});

    EXPECT_EQ(GetStringMember(s, "type").value(), "object");
    const JSONValue* properties = FindMember(s, "properties");
    ASSERT_NE(properties, nullptr);
    const JSONValue* count = FindMember(*properties, "count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(GetStringMember(*count, "type").value(), "number");
    ASSERT_NE(FindMember(*count, "minimum"), nullptr);
    EXPECT_EQ(*FindMember(*count, "maximum"), JSONValue(10.0));
    const JSONValue* tags = FindMember(*properties, "tags");
    ASSERT_NE(tags, nullptr);
    ASSERT_NE(FindMember(*tags, "items"), nullptr);

    const JSONValue* required = FindMember(s, "required");
    ASSERT_NE(required, nullptr);
    ASSERT_TRUE(required->isArray());
    const auto& arr = std::get<JSONValue::Array>(required->value);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(*arr[0], JSONValue("path"));

    JSONValue nested = schema::ObjectParameter("Options", props, {});
    EXPECT_EQ(FindMember(nested, "required"), nullptr);
}
