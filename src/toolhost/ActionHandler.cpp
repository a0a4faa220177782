//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionHandler.cpp
// Purpose: Action adapter implementation
//==========================================================================================================

#include "toolhost/ActionHandler.h"

#include <format>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/ServerConfig.h"

namespace toolhost {

namespace {
std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

std::string requireStringParam(const JSONValue& params, const char* key) {
    const JSONValue* v = params.find(key);
    if (!v || !v->isString()) {
        throw std::invalid_argument(std::format("Missing string parameter '{}'", key));
    }
    return std::get<std::string>(v->value);
}

std::optional<std::string> optionalStringParam(const JSONValue& params, const char* key) {
    const JSONValue* v = params.find(key);
    if (!v || v->isNull()) {
        return std::nullopt;
    }
    if (!v->isString()) {
        throw std::invalid_argument(std::format("Parameter '{}' must be a string", key));
    }
    return std::get<std::string>(v->value);
}
} // namespace

ActionHandler::ActionHandler(ToolServerClient& client) : client_(client) {}

JSONValue ActionHandler::StartServer(const std::string& templateName, const std::optional<std::string>& root,
                                     const JSONValue& overrides, const std::optional<std::string>& projectName) {
    FUNC_SCOPE();
    ServerConfig config = BuildConfig(templateName, root, OverridesFromJSON(overrides));
    const std::string id = client_.StartServer(config, projectName);
    JSONValue::Object out;
    out["serverId"] = str(id);
    out["info"] = std::make_shared<JSONValue>(ServerInfoToJSON(client_.GetInfo(id)));
    return JSONValue(std::move(out));
}

JSONValue ActionHandler::StopServer(const std::string& serverId) {
    FUNC_SCOPE();
    client_.StopServer(serverId);
    JSONValue::Object out;
    out["serverId"] = str(serverId);
    out["stopped"] = std::make_shared<JSONValue>(true);
    return JSONValue(std::move(out));
}

JSONValue ActionHandler::ListTools(const std::string& serverId) {
    JSONValue::Array tools;
    for (const auto& tool : client_.ListTools(serverId)) {
        tools.push_back(std::make_shared<JSONValue>(ToolToJSON(tool)));
    }
    JSONValue::Object out;
    out["serverId"] = str(serverId);
    out["tools"] = std::make_shared<JSONValue>(std::move(tools));
    return JSONValue(std::move(out));
}

JSONValue ActionHandler::CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& arguments,
                                  std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    JSONValue result = client_.CallTool(serverId, toolName, arguments, timeout);
    JSONValue::Object out;
    out["serverId"] = str(serverId);
    out["tool"] = str(toolName);
    out["result"] = std::make_shared<JSONValue>(std::move(result));
    return JSONValue(std::move(out));
}

JSONValue ActionHandler::Status(const std::optional<std::string>& serverId) {
    JSONValue::Object out;
    if (serverId.has_value()) {
        out["serverId"] = str(serverId.value());
        out["status"] = str(toString(client_.GetStatus(serverId.value())));
        return JSONValue(std::move(out));
    }
    JSONValue::Array servers;
    for (const auto& info : client_.Registry().ListAll()) {
        servers.push_back(std::make_shared<JSONValue>(ServerInfoToJSON(info)));
    }
    out["servers"] = std::make_shared<JSONValue>(std::move(servers));
    return JSONValue(std::move(out));
}

JSONValue ActionHandler::Dispatch(const std::string& action, const JSONValue& params) {
    LOG_DEBUG("ActionHandler: {}", action);
    if (!params.isNull() && !params.isObject()) {
        throw std::invalid_argument("Action parameters must be a JSON object");
    }
    if (action == "start_server") {
        const JSONValue* overrides = params.find("overrides");
        return StartServer(requireStringParam(params, "template"), optionalStringParam(params, "root"),
                           overrides ? *overrides : JSONValue{}, optionalStringParam(params, "projectName"));
    }
    if (action == "stop_server") {
        return StopServer(requireStringParam(params, "serverId"));
    }
    if (action == "list_tools") {
        return ListTools(requireStringParam(params, "serverId"));
    }
    if (action == "call_tool") {
        const JSONValue* args = params.find("arguments");
        std::optional<std::chrono::milliseconds> timeout;
        if (const JSONValue* t = params.find("timeoutMs")) {
            if (!std::holds_alternative<int64_t>(t->value)) {
                throw std::invalid_argument("Parameter 'timeoutMs' must be an integer");
            }
            timeout = std::chrono::milliseconds(std::get<int64_t>(t->value));
        }
        return CallTool(requireStringParam(params, "serverId"), requireStringParam(params, "tool"),
                        args ? *args : JSONValue{}, timeout);
    }
    if (action == "server_status") {
        return Status(optionalStringParam(params, "serverId"));
    }
    throw std::invalid_argument(std::format("Unknown action: {}", action));
}

} // namespace toolhost
