//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-server protocol constants and the data records shared by registry, client and handlers
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision announced in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Client identity reported as clientInfo.name
constexpr const char* CLIENT_NAME = "toolhost";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Shutdown = "shutdown";
}

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// ToolInputSchema
// Purpose: Argument schema of a tool. Keys other than type/properties/required are kept in
//          `additional` so nothing the server declared is lost.
//==========================================================================================================
struct ToolInputSchema {
    std::string type{"object"};
    JSONValue properties{JSONValue::Object{}};
    std::vector<std::string> required;
    JSONValue::Object additional;
};

struct Tool {
    std::string name;
    std::string description;
    ToolInputSchema inputSchema;

    Tool() = default;
    Tool(std::string name, std::string description, ToolInputSchema schema = ToolInputSchema{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(schema)) {}
};

//==========================================================================================================
// ParseTool
// Purpose: Builds a Tool from one element of a tools/list "tools" array.
// Returns:
//   std::nullopt when the element is not an object or lacks a non-empty string name.
//==========================================================================================================
std::optional<Tool> ParseTool(const JSONValue& value);

// Serializes a Tool back into its wire shape { name, description, inputSchema }.
JSONValue ToolToJSON(const Tool& tool);

// Deep copy of a Tool; the schema JSON shares no nodes with the source.
Tool CloneTool(const Tool& tool);

//==========================================================================================================
// ToolsPage
// Purpose: One page of a tools/list result.
//==========================================================================================================
struct ToolsPage {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
    size_t skipped{0};
};

//==========================================================================================================
// ParseToolsPage
// Purpose: Decodes a tools/list result. Invalid entries are skipped and counted.
// Throws:
//   std::invalid_argument when the result is not an object with a "tools" array.
//==========================================================================================================
ToolsPage ParseToolsPage(const JSONValue& result);

///////////////////////////////////////// Servers ///////////////////////////////////////////
enum class ServerStatus {
    Starting,
    Ready,
    Error,
    Stopped
};

const char* toString(ServerStatus status);

// Parses "starting", "ready", "error" or "stopped"; std::nullopt otherwise.
std::optional<ServerStatus> parseServerStatus(const std::string& text);

//==========================================================================================================
// ServerInfo
// Purpose: Snapshot of one registered server. Registry accessors always hand out copies.
//==========================================================================================================
struct ServerInfo {
    std::string serverId;
    std::string name;
    std::optional<std::string> projectName;
    ServerStatus status{ServerStatus::Starting};
    std::optional<int> pid;
    std::vector<Tool> tools;
    std::optional<std::string> errorMessage;
    std::chrono::system_clock::time_point startedAt{};
};

// Serializes a ServerInfo summary { serverId, name, status, pid?, projectName?, error?, toolCount, tools }.
JSONValue ServerInfoToJSON(const ServerInfo& info);

} // namespace toolhost
