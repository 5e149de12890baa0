//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Demo server over stdio (echo, add, read_file tools; one resource; one prompt)
//==========================================================================================================

#include <cstdlib>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>
#include <stop_token>

#include "logging/Logger.h"
#include "mcphub/Server.h"
#include "mcphub/StdioTransport.hpp"
#include "mcphub/ToolRegistry.h"
#include "mcphub/version.h"

using namespace mcphub;

namespace {

double numberArg(const JSONValue& args, const char* key) {
    const JSONValue* v = FindMember(args, key);
    if (v != nullptr) {
        if (std::holds_alternative<int64_t>(v->value)) {
            return static_cast<double>(std::get<int64_t>(v->value));
        }
        if (std::holds_alternative<double>(v->value)) {
            return std::get<double>(v->value);
        }
    }
    throw std::invalid_argument(std::string("argument '") + key + "' must be a number");
}

std::string stringArg(const JSONValue& args, const char* key) {
    auto v = GetStringMember(args, key);
    if (!v.has_value()) {
        throw std::invalid_argument(std::string("argument '") + key + "' must be a string");
    }
    return v.value();
}

ToolResult textResult(std::string text) {
    ToolResult r;
    r.content.push_back(Content::Text(std::move(text)));
    return r;
}

void registerTools(ToolRegistry& registry) {
    JSONValue::Object echoProps;
    echoProps["text"] = std::make_shared<JSONValue>(schema::StringParameter("Text to echo back"));
    registry.RegisterTool(Tool{"echo", "Echo back the input text", schema::ToolSchema("Echo tool", echoProps, {"text"})},
        [](const JSONValue& args, std::stop_token) {
            return std::async(std::launch::async, [args]() { return textResult("Echo: " + stringArg(args, "text")); });
        });

    JSONValue::Object addProps;
    addProps["a"] = std::make_shared<JSONValue>(schema::NumberParameter("First addend"));
    addProps["b"] = std::make_shared<JSONValue>(schema::NumberParameter("Second addend"));
    registry.RegisterTool(Tool{"add", "Add two numbers", schema::ToolSchema("Adder", addProps, {"a", "b"})},
        [](const JSONValue& args, std::stop_token) {
            return std::async(std::launch::async, [args]() {
                double sum = numberArg(args, "a") + numberArg(args, "b");
                return textResult(SerializeJSON(JSONValue(sum)));
            });
        });

    JSONValue::Object readProps;
    readProps["path"] = std::make_shared<JSONValue>(schema::StringParameter("File path to read"));
    registry.RegisterTool(Tool{"read_file", "Read contents of a file", schema::ToolSchema("Read file contents", readProps, {"path"})},
        [](const JSONValue& args, std::stop_token) {
            return std::async(std::launch::async, [args]() {
                std::string path = stringArg(args, "path");
                std::ifstream in(path, std::ios::binary);
                if (!in) {
                    throw std::runtime_error("cannot open " + path);
                }
                std::ostringstream oss;
                oss << in.rdbuf();
                return textResult(oss.str());
            });
        });
}

} // namespace

int main() {
    // Frames go to stdout; keep diagnostics on stderr
    ::setenv("MCPHUB_STDIO_MODE", "1", 1);
    FUNC_SCOPE();

    auto registry = std::make_shared<ToolRegistry>();
    registerTools(*registry);

    Server server(makeImplementation("mcphub-demo-server"), registry);
    server.RegisterResource(Resource{"mcphub://server/info", "Server info", std::string("Name and version"), std::string("text/plain")},
        [](const std::string& uri, std::stop_token) {
            std::promise<ReadResourceResult> p;
            ReadResourceResult r;
            r.contents.push_back(ResourceContents{uri, std::string("text/plain"),
                                                  "mcphub-demo-server " + getVersionString(), std::nullopt});
            p.set_value(std::move(r));
            return p.get_future();
        });
    server.RegisterPrompt(Prompt{"greeting", "Greets someone", {PromptArgument{"name", std::string("Who to greet"), true}}},
        [](const JSONValue& args) {
            GetPromptResult r;
            r.description = "Greeting";
            r.messages.push_back(PromptMessage{"user", Content::Text("Hello, " + GetStringMember(args, "name").value_or("world") + "!")});
            return r;
        });

    try {
        server.Start(std::make_unique<StdioTransport>()).get();
    } catch (const std::exception& e) {
        LOG_ERROR("stdio_server: failed to start: {}", e.what());
        return EXIT_FAILURE;
    }
    server.Wait();
    server.Stop().get();
    LOG_INFO("stdio_server: exiting");
    return EXIT_SUCCESS;
}
