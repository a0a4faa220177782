//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/filesystem_demo/main.cpp
// Purpose: Starts the filesystem tool server on a directory, lists its tools, lists the directory, stops
//==========================================================================================================

#include <iostream>
#include <string>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/ToolServerClient.h"
#include "toolhost/errors/Errors.h"

int main(int argc, char** argv) {
    using namespace toolhost;
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    const std::string root = argc > 1 ? argv[1] : ".";
    ToolServerClient client;
    try {
        ServerConfig config = BuildConfig("filesystem", root);
        // The filesystem server takes its allowed directories as arguments
        config.command.push_back(root);

        const std::string id = client.StartServer(config, std::string("filesystem_demo"));
        std::cout << "server " << id << " ready" << std::endl;
        for (const auto& tool : client.ListTools(id)) {
            std::cout << "  " << tool.name << " - " << tool.description << std::endl;
        }

        JSONValue::Object args;
        args["path"] = std::make_shared<JSONValue>(root);
        JSONValue result = client.CallTool(id, "list_directory", JSONValue(args));
        std::cout << SerializeJSON(result) << std::endl;

        client.StopServer(id);
    } catch (const errors::ToolHostError& e) {
        LOG_ERROR("filesystem_demo failed [{}]: {}", errors::toString(e.kind()), e.what());
        return 1;
    }
    std::cout << "filesystem_demo: ok" << std::endl;
    return 0;
}
