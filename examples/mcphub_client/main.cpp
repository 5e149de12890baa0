//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line client: connect one server, list its items, optionally call a tool
//==========================================================================================================

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcphub/Client.h"
#include "mcphub/Config.h"
#include "mcphub/version.h"

using namespace mcphub;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--server")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static void usage() {
    std::cerr << "usage: mcphub_client --server=\"transport=pipe; command=./mcphub_stdio_server\"\n"
              << "                     [--name=demo] [--call=tool] [--args='{\"text\":\"hi\"}'] [--log=path]\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    auto serverCfg = getArgValue(argc, argv, "--server");
    if (!serverCfg.has_value()) {
        usage();
        return EXIT_FAILURE;
    }
    if (auto logPath = getArgValue(argc, argv, "--log")) {
        Logger::setLogFile(logPath.value());
    }
    std::string name = getArgValue(argc, argv, "--name").value_or("server");

    ServerConfig config;
    try {
        config = ParseServerConfig(serverCfg.value());
    } catch (const std::invalid_argument& e) {
        std::cerr << "invalid --server: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    Client client(makeImplementation("mcphub-client"));
    try {
        client.ConnectServer(name, config).get();
    } catch (const errors::McpException& e) {
        std::cerr << "connect failed: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "tools:\n";
    for (const auto& t : client.GetAvailableTools()) {
        std::cout << "  " << t.server << ":" << t.tool.name << " - " << t.tool.description << "\n";
    }
    std::cout << "resources:\n";
    for (const auto& key : client.ListResources()) {
        std::cout << "  " << key << "\n";
    }
    std::cout << "prompts:\n";
    for (const auto& key : client.ListPrompts()) {
        std::cout << "  " << key << "\n";
    }

    int rc = EXIT_SUCCESS;
    if (auto tool = getArgValue(argc, argv, "--call")) {
        try {
            JSONValue args = ParseJSON(getArgValue(argc, argv, "--args").value_or("{}"));
            ToolResult result = client.CallTool(tool.value(), args).get();
            for (const auto& text : CollectText(result)) {
                std::cout << text << "\n";
            }
            if (result.isError) {
                rc = EXIT_FAILURE;
            }
        } catch (const errors::McpException& e) {
            std::cerr << "call failed (" << errors::errorCategoryName(e.category()) << "): " << e.what() << "\n";
            rc = EXIT_FAILURE;
        } catch (const std::runtime_error& e) {
            std::cerr << "invalid --args: " << e.what() << "\n";
            rc = EXIT_FAILURE;
        }
    }

    client.Shutdown().get();
    return rc;
}
