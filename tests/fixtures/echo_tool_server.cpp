//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: echo_tool_server.cpp
// Purpose: Minimal line-delimited JSON-RPC tool server used by process-level tests
//==========================================================================================================
//
// Options:
//   --silent          read requests but never answer
//   --paged           split tools/list into two pages
//   --ignore-sigterm  ignore SIGTERM and keep running after stdin closes
//   --noise           emit stderr chatter, a notification and a malformed line before answering
//
// Tools: echo{text}, add{a,b}, env{name}, cwd{}, sleep{ms}, fail{}, crash{}

#include <unistd.h>
#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

using namespace toolhost;

namespace {

std::mutex gOutMutex;

void emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(gOutMutex);
    std::cout << line << '\n' << std::flush;
}

std::shared_ptr<JSONValue> s(const std::string& v) { return std::make_shared<JSONValue>(v); }

JSONValue textResult(const std::string& text) {
    JSONValue::Object item;
    item["type"] = s("text");
    item["text"] = s(text);
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(item)));
    JSONValue::Object result;
    result["content"] = std::make_shared<JSONValue>(std::move(content));
    result["isError"] = std::make_shared<JSONValue>(false);
    return JSONValue(std::move(result));
}

JSONValue schema(const std::vector<std::string>& props, const std::vector<std::string>& required) {
    JSONValue::Object properties;
    for (const auto& p : props) {
        JSONValue::Object t;
        t["type"] = s("string");
        properties[p] = std::make_shared<JSONValue>(std::move(t));
    }
    JSONValue::Array req;
    for (const auto& r : required) req.push_back(s(r));
    JSONValue::Object o;
    o["type"] = s("object");
    o["properties"] = std::make_shared<JSONValue>(std::move(properties));
    o["required"] = std::make_shared<JSONValue>(std::move(req));
    return JSONValue(std::move(o));
}

std::shared_ptr<JSONValue> tool(const std::string& name, const std::string& description, JSONValue inputSchema) {
    JSONValue::Object t;
    t["name"] = s(name);
    t["description"] = s(description);
    t["inputSchema"] = std::make_shared<JSONValue>(std::move(inputSchema));
    return std::make_shared<JSONValue>(std::move(t));
}

JSONValue::Array allTools() {
    JSONValue::Array tools;
    tools.push_back(tool("echo", "Echo text back", schema({"text"}, {"text"})));
    tools.push_back(tool("add", "Add two integers", schema({"a", "b"}, {"a", "b"})));
    tools.push_back(tool("env", "Read an environment variable", schema({"name"}, {"name"})));
    tools.push_back(tool("cwd", "Report the working directory", schema({}, {})));
    tools.push_back(tool("sleep", "Sleep for ms then answer", schema({"ms"}, {"ms"})));
    tools.push_back(tool("fail", "Always fails", schema({}, {})));
    tools.push_back(tool("crash", "Exit without answering", schema({}, {})));
    return tools;
}

std::string stringArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = args.find(key);
    return (v && v->isString()) ? std::get<std::string>(v->value) : std::string();
}

int64_t intArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = args.find(key);
    if (v && std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    return 0;
}

void reply(const JSONRPCId& id, JSONValue result) {
    JSONRPCResponse resp(id, std::move(result));
    emit(resp.Serialize());
}

void replyError(const JSONRPCId& id, int code, const std::string& message) {
    emit(CreateErrorResponse(id, code, message, JSONValue(std::string("fixture")))->Serialize());
}

void handleCall(const JSONRPCRequest& req) {
    const JSONValue params = req.params.value_or(JSONValue{});
    const std::string name = stringArg(params, "name");
    const JSONValue* argsPtr = params.find("arguments");
    const JSONValue args = argsPtr ? *argsPtr : JSONValue(JSONValue::Object{});

    if (name == "echo") {
        reply(req.id, textResult(stringArg(args, "text")));
    } else if (name == "add") {
        reply(req.id, textResult(std::to_string(intArg(args, "a") + intArg(args, "b"))));
    } else if (name == "env") {
        const char* v = std::getenv(stringArg(args, "name").c_str());
        reply(req.id, textResult(v ? v : ""));
    } else if (name == "cwd") {
        char buf[4096];
        reply(req.id, textResult(::getcwd(buf, sizeof(buf)) ? buf : ""));
    } else if (name == "sleep") {
        const int64_t ms = intArg(args, "ms");
        std::thread([id = req.id, ms]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            reply(id, textResult("slept " + std::to_string(ms)));
        }).detach();
    } else if (name == "fail") {
        replyError(req.id, -32000, "tool failed on purpose");
    } else if (name == "crash") {
        std::_Exit(3);
    } else {
        replyError(req.id, JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + name);
    }
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries protocol traffic only
    ::setenv("TOOLHOST_STDIO_MODE", "1", 1);

    bool silent = false;
    bool paged = false;
    bool noise = false;
    bool ignoreTerm = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--silent") silent = true;
        else if (arg == "--paged") paged = true;
        else if (arg == "--noise") noise = true;
        else if (arg == "--ignore-sigterm") ignoreTerm = true;
    }

    if (ignoreTerm) {
        ::signal(SIGTERM, SIG_IGN);
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (silent) {
            continue;
        }
        JSONValue root;
        try {
            root = ParseJSON(line);
        } catch (const std::exception& e) {
            std::cerr << "fixture: bad input: " << e.what() << std::endl;
            continue;
        }
        JSONRPCRequest req;
        if (!req.Deserialize(line)) {
            // Notification (e.g. notifications/initialized) or a response to us
            continue;
        }

        if (req.method == "initialize") {
            if (noise) {
                std::cerr << "fixture: starting up" << std::endl;
                emit("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"level\":\"info\"}}");
                emit("this is not json");
            }
            JSONValue::Object info;
            info["name"] = s("echo-fixture");
            info["version"] = s("1.0.0");
            JSONValue::Object result;
            result["protocolVersion"] = s("2024-11-05");
            result["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
            result["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
            reply(req.id, JSONValue(std::move(result)));
        } else if (req.method == "tools/list") {
            JSONValue::Array tools = allTools();
            JSONValue::Object result;
            if (paged) {
                const JSONValue params = req.params.value_or(JSONValue{});
                const bool second = params.find("cursor") != nullptr;
                const std::size_t half = tools.size() / 2;
                JSONValue::Array page(second ? tools.begin() + static_cast<long>(half) : tools.begin(),
                                      second ? tools.end() : tools.begin() + static_cast<long>(half));
                result["tools"] = std::make_shared<JSONValue>(std::move(page));
                if (!second) result["nextCursor"] = s("page-2");
            } else {
                result["tools"] = std::make_shared<JSONValue>(std::move(tools));
            }
            reply(req.id, JSONValue(std::move(result)));
        } else if (req.method == "tools/call") {
            handleCall(req);
        } else if (req.method == "shutdown") {
            reply(req.id, JSONValue(JSONValue::Object{}));
            return 0;
        } else {
            replyError(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
    }
    // Outlive stdin so only SIGKILL ends the process
    while (ignoreTerm) {
        ::pause();
    }
    return 0;
}
