//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionHandler.h
// Purpose: Translates collaborator actions into ToolServerClient calls with JSON results
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ToolServerClient.h"

namespace toolhost {

//==========================================================================================================
// ActionHandler
// Purpose: Thin adapter for callers that speak in named actions and JSON objects.
// Result shapes:
//   StartServer -> { serverId, info }
//   StopServer  -> { serverId, stopped: true }
//   ListTools   -> { serverId, tools: [ {name, description, inputSchema} ] }
//   CallTool    -> { serverId, tool, result }
//   Status      -> { serverId, status } or { servers: [ info... ] }
// Errors:
//   Exceptions from the client propagate unchanged.
//==========================================================================================================
class ActionHandler {
public:
    explicit ActionHandler(ToolServerClient& client);

    JSONValue StartServer(const std::string& templateName,
                          const std::optional<std::string>& root = std::nullopt,
                          const JSONValue& overrides = JSONValue{},
                          const std::optional<std::string>& projectName = std::nullopt);
    JSONValue StopServer(const std::string& serverId);
    JSONValue ListTools(const std::string& serverId);
    JSONValue CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& arguments,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    JSONValue Status(const std::optional<std::string>& serverId = std::nullopt);

    //==========================================================================================================
    // Dispatch
    // Purpose: Runs an action by name with parameters taken from an object:
    //   start_server {template, root?, overrides?, projectName?}
    //   stop_server  {serverId}
    //   list_tools   {serverId}
    //   call_tool    {serverId, tool, arguments?, timeoutMs?}
    //   server_status {serverId?}
    // Throws:
    //   std::invalid_argument for an unknown action or a missing/mistyped parameter.
    //==========================================================================================================
    JSONValue Dispatch(const std::string& action, const JSONValue& params);

private:
    ToolServerClient& client_;
};

} // namespace toolhost
