//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_action_handler.cpp
// Purpose: GoogleTests for the named-action adapter over ToolServerClient
//==========================================================================================================

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "toolhost/ActionHandler.h"
#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ToolServerClient.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;

namespace {

// Minimal filesystem-like peer: one tool, list_directory{path}.
void fakeFilesystem(const std::string& line, InMemoryTransport& t) {
    JSONRPCRequest req;
    if (!req.Deserialize(line)) {
        return;
    }
    if (req.method == "initialize" || req.method == "shutdown") {
        t.DeliverLine(JSONRPCResponse(req.id, JSONValue(JSONValue::Object{})).Serialize());
    } else if (req.method == "tools/list") {
        t.DeliverLine(JSONRPCResponse(req.id, ParseJSON(R"({"tools":[{"name":"list_directory",
            "description":"List a directory","inputSchema":{"type":"object","properties":{"path":{"type":"string"}},
            "required":["path"]}}]})")).Serialize());
    } else if (req.method == "tools/call") {
        t.DeliverLine(JSONRPCResponse(req.id, ParseJSON(R"({"content":[{"type":"text","text":"[FILE] a.txt"}]})"))
                          .Serialize());
    }
}

const std::string& stringAt(const JSONValue& v, const char* key) {
    return std::get<std::string>(v.find(key)->value);
}

} // namespace

class ActionHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto factory = std::make_shared<InMemoryTransportFactory>([](InMemoryTransport& t, const ServerConfig&) {
            t.SetPeer(fakeFilesystem);
        });
        client = std::make_unique<ToolServerClient>(factory);
        handler = std::make_unique<ActionHandler>(*client);
    }
    void TearDown() override {
        handler.reset();
        client.reset();
    }

    std::unique_ptr<ToolServerClient> client;
    std::unique_ptr<ActionHandler> handler;
};

TEST_F(ActionHandlerTest, StartListCallStatusStop) {
    JSONValue started = handler->Dispatch("start_server",
                                          ParseJSON(R"({"template":"filesystem","root":"/tmp","projectName":"demo"})"));
    const std::string id = stringAt(started, "serverId");
    ASSERT_FALSE(id.empty());
    const JSONValue* info = started.find("info");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(stringAt(*info, "status"), "ready");
    EXPECT_EQ(stringAt(*info, "name"), "filesystem");
    EXPECT_EQ(stringAt(*info, "projectName"), "demo");

    JSONValue::Object params;
    params["serverId"] = std::make_shared<JSONValue>(id);
    JSONValue tools = handler->Dispatch("list_tools", JSONValue(params));
    const auto& list = std::get<JSONValue::Array>(tools.find("tools")->value);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(stringAt(*list[0], "name"), "list_directory");
    ASSERT_NE(list[0]->find("inputSchema"), nullptr);

    JSONValue::Object call = params;
    call["tool"] = std::make_shared<JSONValue>(std::string("list_directory"));
    call["arguments"] = std::make_shared<JSONValue>(ParseJSON(R"({"path":"/tmp"})"));
    call["timeoutMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(2000));
    JSONValue called = handler->Dispatch("call_tool", JSONValue(call));
    EXPECT_EQ(stringAt(called, "tool"), "list_directory");
    ASSERT_NE(called.find("result"), nullptr);
    EXPECT_NE(called.find("result")->find("content"), nullptr);

    JSONValue status = handler->Dispatch("server_status", JSONValue(params));
    EXPECT_EQ(stringAt(status, "status"), "ready");

    JSONValue all = handler->Dispatch("server_status", JSONValue{});
    EXPECT_EQ(std::get<JSONValue::Array>(all.find("servers")->value).size(), 1u);

    JSONValue stopped = handler->Dispatch("stop_server", JSONValue(params));
    EXPECT_TRUE(std::get<bool>(stopped.find("stopped")->value));
    EXPECT_THROW(handler->Dispatch("server_status", JSONValue(params)), errors::UnknownServerError);
}

TEST_F(ActionHandlerTest, OverridesReachTheConfig) {
    JSONValue started = handler->StartServer("filesystem", std::nullopt,
                                             ParseJSON(R"({"name":"fs-renamed","initTimeoutMs":1000})"));
    EXPECT_EQ(stringAt(*started.find("info"), "name"), "fs-renamed");
}

TEST_F(ActionHandlerTest, RejectsBadRequests) {
    EXPECT_THROW(handler->Dispatch("reboot_universe", JSONValue{}), std::invalid_argument);
    EXPECT_THROW(handler->Dispatch("stop_server", JSONValue{}), std::invalid_argument);
    EXPECT_THROW(handler->Dispatch("list_tools", ParseJSON("[1]")), std::invalid_argument);
    EXPECT_THROW(handler->Dispatch("call_tool", ParseJSON(R"({"serverId":"x","tool":"t","timeoutMs":"soon"})")),
                 std::invalid_argument);
    EXPECT_THROW(handler->Dispatch("start_server", ParseJSON(R"({"template":"mongodb"})")),
                 errors::ConfigurationError);
    EXPECT_EQ(client->Registry().Size(), 0u);
}
