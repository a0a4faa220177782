//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Tool and server record conversions to and from JSON
//==========================================================================================================

#include "toolhost/Protocol.h"

#include <stdexcept>

namespace toolhost {

namespace {
std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

ToolInputSchema parseSchema(const JSONValue* schemaVal) {
    ToolInputSchema schema;
    if (!schemaVal || !schemaVal->isObject()) {
        return schema;
    }
    for (const auto& [key, val] : std::get<JSONValue::Object>(schemaVal->value)) {
        if (!val) {
            continue;
        }
        if (key == "type" && val->isString()) {
            schema.type = std::get<std::string>(val->value);
        } else if (key == "properties" && val->isObject()) {
            schema.properties = *val;
        } else if (key == "required" && val->isArray()) {
            for (const auto& item : std::get<JSONValue::Array>(val->value)) {
                if (item && item->isString()) {
                    schema.required.push_back(std::get<std::string>(item->value));
                }
            }
        } else {
            schema.additional[key] = val;
        }
    }
    return schema;
}
} // namespace

std::optional<Tool> ParseTool(const JSONValue& value) {
    const JSONValue* nameVal = value.find("name");
    if (!nameVal || !nameVal->isString() || std::get<std::string>(nameVal->value).empty()) {
        return std::nullopt;
    }
    Tool tool;
    tool.name = std::get<std::string>(nameVal->value);
    if (const JSONValue* d = value.find("description"); d && d->isString()) {
        tool.description = std::get<std::string>(d->value);
    }
    tool.inputSchema = parseSchema(value.find("inputSchema"));
    return tool;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object schema = tool.inputSchema.additional;
    schema["type"] = str(tool.inputSchema.type);
    schema["properties"] = std::make_shared<JSONValue>(tool.inputSchema.properties);
    JSONValue::Array required;
    for (const auto& r : tool.inputSchema.required) {
        required.push_back(str(r));
    }
    schema["required"] = std::make_shared<JSONValue>(std::move(required));

    JSONValue::Object obj;
    obj["name"] = str(tool.name);
    obj["description"] = str(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(std::move(schema));
    return JSONValue(std::move(obj));
}

Tool CloneTool(const Tool& tool) {
    Tool out(tool.name, tool.description);
    out.inputSchema.type = tool.inputSchema.type;
    out.inputSchema.properties = CloneJSON(tool.inputSchema.properties);
    out.inputSchema.required = tool.inputSchema.required;
    for (const auto& [key, val] : tool.inputSchema.additional) {
        out.inputSchema.additional[key] = val ? std::make_shared<JSONValue>(CloneJSON(*val)) : nullptr;
    }
    return out;
}

ToolsPage ParseToolsPage(const JSONValue& result) {
    const JSONValue* toolsVal = result.find("tools");
    if (!toolsVal || !toolsVal->isArray()) {
        throw std::invalid_argument("tools/list result has no \"tools\" array");
    }
    ToolsPage page;
    for (const auto& item : std::get<JSONValue::Array>(toolsVal->value)) {
        std::optional<Tool> tool = item ? ParseTool(*item) : std::optional<Tool>{};
        if (!tool.has_value()) {
            ++page.skipped;
            continue;
        }
        page.tools.push_back(std::move(tool.value()));
    }
    if (const JSONValue* c = result.find("nextCursor"); c && c->isString() &&
        !std::get<std::string>(c->value).empty()) {
        page.nextCursor = std::get<std::string>(c->value);
    }
    return page;
}

const char* toString(ServerStatus status) {
    switch (status) {
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Ready: return "ready";
        case ServerStatus::Error: return "error";
        case ServerStatus::Stopped: return "stopped";
    }
    return "unknown";
}

std::optional<ServerStatus> parseServerStatus(const std::string& text) {
    if (text == "starting") return ServerStatus::Starting;
    if (text == "ready") return ServerStatus::Ready;
    if (text == "error") return ServerStatus::Error;
    if (text == "stopped") return ServerStatus::Stopped;
    return std::nullopt;
}

JSONValue ServerInfoToJSON(const ServerInfo& info) {
    JSONValue::Object obj;
    obj["serverId"] = str(info.serverId);
    obj["name"] = str(info.name);
    obj["status"] = str(toString(info.status));
    if (info.projectName.has_value()) {
        obj["projectName"] = str(info.projectName.value());
    }
    if (info.pid.has_value()) {
        obj["pid"] = std::make_shared<JSONValue>(static_cast<int64_t>(info.pid.value()));
    }
    if (info.errorMessage.has_value()) {
        obj["error"] = str(info.errorMessage.value());
    }
    const auto startedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        info.startedAt.time_since_epoch()).count();
    obj["startedAtMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(startedMs));
    obj["toolCount"] = std::make_shared<JSONValue>(static_cast<int64_t>(info.tools.size()));
    JSONValue::Array names;
    for (const auto& t : info.tools) {
        names.push_back(str(t.name));
    }
    obj["tools"] = std::make_shared<JSONValue>(std::move(names));
    return JSONValue(std::move(obj));
}

} // namespace toolhost
