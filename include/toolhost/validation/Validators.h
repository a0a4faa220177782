//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for tools/list results and tool-call arguments
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "toolhost/Protocol.h"

namespace toolhost {
namespace validation {

//------------------------------ tools/list ------------------------------
// true when v is { tools: [ {name: string, ...}, ... ], nextCursor?: string }
inline bool validateToolsListResultJson(const JSONValue& v) {
    const JSONValue* tools = v.find("tools");
    if (!tools || !tools->isArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(tools->value)) {
        if (!p) return false;
        const JSONValue* name = p->find("name");
        if (!name || !name->isString()) return false;
    }
    const JSONValue* cursor = v.find("nextCursor");
    if (cursor && !cursor->isString() && !cursor->isNull()) return false;
    return true;
}

//------------------------------ tools/call ------------------------------
// Returns the names listed in tool.inputSchema.required that are absent from arguments.
inline std::vector<std::string> missingRequiredArguments(const Tool& tool, const JSONValue& arguments) {
    std::vector<std::string> missing;
    for (const auto& name : tool.inputSchema.required) {
        if (!arguments.find(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

// Finds a tool by name in a discovered tool list.
inline std::optional<Tool> findTool(const std::vector<Tool>& tools, const std::string& name) {
    for (const auto& t : tools) {
        if (t.name == name) return t;
    }
    return std::nullopt;
}

} // namespace validation
} // namespace toolhost
