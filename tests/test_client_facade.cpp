//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client_facade.cpp
// Purpose: GoogleTests for ToolServerClient lifecycle against scripted in-memory servers
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/ToolServerClient.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/validation/Validation.h"
#include "toolhost/version.h"

using namespace toolhost;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) { return std::make_shared<JSONValue>(s); }

std::shared_ptr<JSONValue> toolEntry(const std::string& name, const std::vector<std::string>& required) {
    JSONValue::Array req;
    for (const auto& r : required) req.push_back(str(r));
    JSONValue::Object schema;
    schema["type"] = str("object");
    schema["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    schema["required"] = std::make_shared<JSONValue>(std::move(req));
    JSONValue::Object tool;
    tool["name"] = str(name);
    tool["description"] = str(name + " tool");
    tool["inputSchema"] = std::make_shared<JSONValue>(std::move(schema));
    return std::make_shared<JSONValue>(std::move(tool));
}

// Behaves like a small tool server: echo{text}, fail, hang, die.
struct ScriptedServer {
    std::atomic<bool> answerInitialize{true};
    std::atomic<bool> rejectInitialize{false};
    std::atomic<bool> paged{false};

    InMemoryTransport::PeerHandler handler() {
        return [this](const std::string& line, InMemoryTransport& t) { onLine(line, t); };
    }

    void onLine(const std::string& line, InMemoryTransport& t) {
        JSONRPCRequest req;
        if (!req.Deserialize(line)) {
            return;
        }
        const JSONValue params = req.params.value_or(JSONValue{});
        if (req.method == "initialize") {
            if (rejectInitialize.load()) {
                t.DeliverLine(CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "not today")->Serialize());
                return;
            }
            if (!answerInitialize.load()) {
                return;
            }
            JSONValue::Object info;
            info["name"] = str("scripted");
            info["version"] = str("0.0.1");
            JSONValue::Object result;
            result["protocolVersion"] = str("2024-11-05");
            result["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
            t.DeliverLine(JSONRPCResponse(req.id, JSONValue(std::move(result))).Serialize());
        } else if (req.method == "tools/list") {
            JSONValue::Array tools;
            JSONValue::Object result;
            const bool second = params.find("cursor") != nullptr;
            if (!paged.load() || !second) {
                tools.push_back(toolEntry("echo", {"text"}));
                tools.push_back(toolEntry("fail", {}));
            }
            if (!paged.load() || second) {
                tools.push_back(toolEntry("hang", {}));
                tools.push_back(toolEntry("die", {}));
            }
            if (paged.load() && !second) {
                result["nextCursor"] = str("page-2");
            }
            result["tools"] = std::make_shared<JSONValue>(std::move(tools));
            t.DeliverLine(JSONRPCResponse(req.id, JSONValue(std::move(result))).Serialize());
        } else if (req.method == "tools/call") {
            const JSONValue* name = params.find("name");
            const std::string tool = (name && name->isString()) ? std::get<std::string>(name->value) : "";
            if (tool == "echo") {
                const JSONValue* args = params.find("arguments");
                const JSONValue* text = args ? args->find("text") : nullptr;
                JSONValue::Object item;
                item["type"] = str("text");
                item["text"] = str(text && text->isString() ? std::get<std::string>(text->value) : "");
                JSONValue::Array content;
                content.push_back(std::make_shared<JSONValue>(std::move(item)));
                JSONValue::Object result;
                result["content"] = std::make_shared<JSONValue>(std::move(content));
                t.DeliverLine(JSONRPCResponse(req.id, JSONValue(std::move(result))).Serialize());
            } else if (tool == "fail") {
                t.DeliverLine(CreateErrorResponse(req.id, -32000, "tool failed")->Serialize());
            } else if (tool == "hang") {
                // never answers
            } else if (tool == "die") {
                t.SimulateExit("exit code 3");
            } else {
                t.DeliverLine(CreateErrorResponse(req.id, JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + tool)->Serialize());
            }
        } else if (req.method == "shutdown") {
            t.DeliverLine(JSONRPCResponse(req.id, JSONValue(JSONValue::Object{})).Serialize());
        }
    }
};

std::string methodOf(const std::string& line) {
    const JSONValue v = ParseJSON(line);
    const JSONValue* m = v.find("method");
    return (m && m->isString()) ? std::get<std::string>(m->value) : std::string();
}

std::string echoText(const JSONValue& result) {
    const JSONValue* content = result.find("content");
    const auto& arr = std::get<JSONValue::Array>(content->value);
    return std::get<std::string>(arr.at(0)->find("text")->value);
}

ServerConfig scriptedConfig(const std::string& name = "scripted") {
    ServerConfig cfg;
    cfg.name = name;
    cfg.command = {"scripted-server"};
    cfg.initTimeout = 2000ms;
    cfg.requestTimeout = 2000ms;
    cfg.shutdownTimeout = 500ms;
    cfg.terminateGracePeriod = 0ms;
    return cfg;
}

} // namespace

class ClientFacadeTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = std::make_shared<ScriptedServer>();
        failNextSpawn = std::make_shared<std::atomic<bool>>(false);
        auto s = script;
        auto failSpawn = failNextSpawn;
        auto created = &transports;
        auto createdMutex = &transportsMutex;
        factory = std::make_shared<InMemoryTransportFactory>(
            [s, failSpawn, created, createdMutex](InMemoryTransport& t, const ServerConfig&) {
                t.SetPeer(s->handler());
                t.SetPid(777);
                if (failSpawn->exchange(false)) {
                    t.FailNextSpawn("exec failed: No such file or directory");
                }
                std::lock_guard<std::mutex> lock(*createdMutex);
                created->push_back(&t);
            });
        client = std::make_unique<ToolServerClient>(factory);
    }
    void TearDown() override {
        client.reset();
    }

    InMemoryTransport* lastTransport() {
        std::lock_guard<std::mutex> lock(transportsMutex);
        return transports.back();
    }

    std::shared_ptr<ScriptedServer> script;
    std::shared_ptr<std::atomic<bool>> failNextSpawn;
    std::mutex transportsMutex;
    std::vector<InMemoryTransport*> transports;
    std::shared_ptr<InMemoryTransportFactory> factory;
    std::unique_ptr<ToolServerClient> client;
};

TEST_F(ClientFacadeTest, StartCallStop) {
    const std::string id = client->StartServer(scriptedConfig());
    EXPECT_EQ(client->GetStatus(id), ServerStatus::Ready);
    ServerInfo info = client->GetInfo(id);
    ASSERT_TRUE(info.pid.has_value());
    EXPECT_EQ(info.pid.value(), 777);

    auto tools = client->ListTools(id);
    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(tools[0].name, "echo");
    ASSERT_EQ(tools[0].inputSchema.required.size(), 1u);
    EXPECT_EQ(tools[0].inputSchema.required[0], "text");

    JSONValue::Object args;
    args["text"] = str("hi");
    JSONValue result = client->CallTool(id, "echo", JSONValue(args));
    EXPECT_EQ(echoText(result), "hi");

    InMemoryTransport* t = lastTransport();
    auto written = t->GetWrittenLines();
    ASSERT_EQ(written.size(), 4u);
    EXPECT_EQ(methodOf(written[0]), "initialize");
    EXPECT_EQ(methodOf(written[1]), "notifications/initialized");
    EXPECT_EQ(written[1].find("\"id\""), std::string::npos);
    EXPECT_EQ(methodOf(written[2]), "tools/list");
    EXPECT_EQ(methodOf(written[3]), "tools/call");
    EXPECT_NE(written[0].find("\"protocolVersion\":\"2024-11-05\""), std::string::npos);
    EXPECT_NE(written[0].find(getVersionString()), std::string::npos);

    client->StopServer(id);
    EXPECT_THROW(client->GetStatus(id), errors::UnknownServerError);
    EXPECT_THROW(client->ListTools(id), errors::UnknownServerError);
    EXPECT_THROW(client->CallTool(id, "echo", JSONValue(args)), errors::UnknownServerError);
    EXPECT_THROW(client->StopServer(id), errors::UnknownServerError);
    EXPECT_EQ(client->Registry().Size(), 0u);
}

TEST_F(ClientFacadeTest, UnknownServerIdIsRejected) {
    EXPECT_THROW(client->CallTool("does-not-exist", "echo", JSONValue{}), errors::UnknownServerError);
    EXPECT_THROW(client->StopServer("does-not-exist"), errors::UnknownServerError);
    EXPECT_THROW(client->GetInfo("does-not-exist"), errors::UnknownServerError);
}

TEST_F(ClientFacadeTest, CallOnServerThatIsNotReadyWritesNothing) {
    const std::string id = client->StartServer(scriptedConfig());
    client->Registry().SetStatus(id, ServerStatus::Error, std::string("forced"));
    InMemoryTransport* t = lastTransport();
    const size_t before = t->GetWriteCount();
    EXPECT_THROW(client->CallTool(id, "echo", JSONValue{}), errors::ServerNotReadyError);
    EXPECT_EQ(t->GetWriteCount(), before);
}

TEST_F(ClientFacadeTest, ToolErrorIsSurfacedAndServerStaysReady) {
    const std::string id = client->StartServer(scriptedConfig());
    try {
        client->CallTool(id, "fail", JSONValue{});
        FAIL() << "expected ToolCallError";
    } catch (const errors::ToolCallError& e) {
        EXPECT_EQ(e.code(), -32000);
        EXPECT_EQ(e.error().message, "tool failed");
    }
    EXPECT_EQ(client->GetStatus(id), ServerStatus::Ready);
}

TEST_F(ClientFacadeTest, NonObjectArgumentsAreRejectedLocally) {
    const std::string id = client->StartServer(scriptedConfig());
    InMemoryTransport* t = lastTransport();
    const size_t before = t->GetWriteCount();
    try {
        client->CallTool(id, "echo", JSONValue(static_cast<int64_t>(5)));
        FAIL() << "expected ToolCallError";
    } catch (const errors::ToolCallError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
    }
    EXPECT_EQ(t->GetWriteCount(), before);
}

TEST_F(ClientFacadeTest, CallTimeoutLeavesServerUsable) {
    const std::string id = client->StartServer(scriptedConfig());
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client->CallTool(id, "hang", JSONValue{}, 50ms), errors::RequestTimeoutError);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_EQ(client->GetStatus(id), ServerStatus::Ready);
    JSONValue::Object args;
    args["text"] = str("still here");
    EXPECT_EQ(echoText(client->CallTool(id, "echo", JSONValue(args))), "still here");
}

TEST_F(ClientFacadeTest, UnexpectedExitMovesServerToError) {
    const std::string id = client->StartServer(scriptedConfig());
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client->CallTool(id, "die", JSONValue{}, 10000ms), errors::BrokenPipeError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    ServerInfo info = client->GetInfo(id);
    EXPECT_EQ(info.status, ServerStatus::Error);
    ASSERT_TRUE(info.errorMessage.has_value());
    EXPECT_FALSE(info.errorMessage->empty());
    EXPECT_THROW(client->CallTool(id, "echo", JSONValue{}), errors::ServerNotReadyError);

    client->StopServer(id);
    EXPECT_FALSE(client->Registry().Contains(id));
}

TEST_F(ClientFacadeTest, ExitWhileCallPendingWakesCaller) {
    const std::string id = client->StartServer(scriptedConfig());
    InMemoryTransport* t = lastTransport();
    const size_t before = t->GetWriteCount();
    auto pending = std::async(std::launch::async, [this, &id]() {
        return client->CallTool(id, "hang", JSONValue{}, 10000ms);
    });
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (t->GetWriteCount() == before && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(2ms);
    }
    ASSERT_GT(t->GetWriteCount(), before);
    t->SimulateExit("killed by signal 9");
    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    EXPECT_THROW(pending.get(), errors::BrokenPipeError);
    EXPECT_EQ(client->GetStatus(id), ServerStatus::Error);
}

TEST_F(ClientFacadeTest, SpawnFailureLeavesErrorRecord) {
    failNextSpawn->store(true);
    EXPECT_THROW(client->StartServer(scriptedConfig("broken")), errors::SpawnError);
    auto errored = client->Registry().ListByStatus(ServerStatus::Error);
    ASSERT_EQ(errored.size(), 1u);
    EXPECT_EQ(errored[0].name, "broken");
    ASSERT_TRUE(errored[0].errorMessage.has_value());
    EXPECT_NE(errored[0].errorMessage->find("exec failed"), std::string::npos);

    client->StopServer(errored[0].serverId);
    EXPECT_EQ(client->Registry().Size(), 0u);
}

namespace {
// Factory that cannot produce a transport at all
class RefusingFactory : public IProcessTransportFactory {
public:
    explicit RefusingFactory(bool returnNull) : returnNull_(returnNull) {}
    std::unique_ptr<IProcessTransport> CreateTransport(const ServerConfig& config) override {
        if (returnNull_) {
            return nullptr;
        }
        throw errors::SpawnError("no transport for " + config.name);
    }

private:
    bool returnNull_;
};
} // namespace

TEST(ClientFacadeFactoryFailure, ErrorRecordIsRemovableByStopServer) {
    ToolServerClient refusing(std::make_shared<RefusingFactory>(false));
    EXPECT_THROW(refusing.StartServer(scriptedConfig("unbuildable")), errors::SpawnError);
    auto errored = refusing.Registry().ListByStatus(ServerStatus::Error);
    ASSERT_EQ(errored.size(), 1u);
    const std::string id = errored[0].serverId;
    EXPECT_EQ(refusing.GetStatus(id), ServerStatus::Error);
    EXPECT_THROW(refusing.CallTool(id, "echo", JSONValue{}), errors::ServerNotReadyError);

    refusing.StopServer(id);
    EXPECT_FALSE(refusing.Registry().Contains(id));
    EXPECT_THROW(refusing.StopServer(id), errors::UnknownServerError);
}

TEST(ClientFacadeFactoryFailure, ShutdownAllClearsTransportlessRecords) {
    ToolServerClient refusing(std::make_shared<RefusingFactory>(true));
    EXPECT_THROW(refusing.StartServer(scriptedConfig("first")), errors::SpawnError);
    EXPECT_THROW(refusing.StartServer(scriptedConfig("second")), errors::SpawnError);
    EXPECT_EQ(refusing.Registry().Size(), 2u);

    EXPECT_TRUE(refusing.ShutdownAll().empty());
    EXPECT_EQ(refusing.Registry().Size(), 0u);
}

TEST_F(ClientFacadeTest, SilentServerHitsInitializationTimeout) {
    script->answerInitialize = false;
    ServerConfig cfg = scriptedConfig("silent");
    cfg.initTimeout = 100ms;
    EXPECT_THROW(client->StartServer(cfg), errors::InitializationTimeoutError);
    auto errored = client->Registry().ListByStatus(ServerStatus::Error);
    ASSERT_EQ(errored.size(), 1u);
    EXPECT_TRUE(lastTransport()->WasTerminated());
}

TEST_F(ClientFacadeTest, InitializeErrorIsHandshakeError) {
    script->rejectInitialize = true;
    EXPECT_THROW(client->StartServer(scriptedConfig()), errors::HandshakeError);
    EXPECT_EQ(client->Registry().ListByStatus(ServerStatus::Error).size(), 1u);
}

TEST_F(ClientFacadeTest, ToolDiscoveryFollowsCursor) {
    script->paged = true;
    const std::string id = client->StartServer(scriptedConfig());
    auto tools = client->ListTools(id);
    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[3].name, "die");

    auto written = lastTransport()->GetWrittenLines();
    int listCalls = 0;
    for (const auto& line : written) {
        if (methodOf(line) == "tools/list") {
            ++listCalls;
            if (listCalls == 2) {
                EXPECT_NE(line.find("\"cursor\":\"page-2\""), std::string::npos);
            }
        }
    }
    EXPECT_EQ(listCalls, 2);
}

TEST_F(ClientFacadeTest, StrictModeChecksToolAndRequiredArguments) {
    client->SetValidationMode(validation::ValidationMode::Strict);
    const std::string id = client->StartServer(scriptedConfig());
    InMemoryTransport* t = lastTransport();
    const size_t before = t->GetWriteCount();

    EXPECT_THROW(client->CallTool(id, "echo", JSONValue{}), errors::ToolCallError);
    EXPECT_THROW(client->CallTool(id, "nope", JSONValue{}), errors::ToolCallError);
    EXPECT_EQ(t->GetWriteCount(), before);

    client->SetValidationMode(validation::ValidationMode::Off);
    EXPECT_THROW(client->CallTool(id, "nope", JSONValue{}), errors::ToolCallError);
    EXPECT_EQ(t->GetWriteCount(), before + 1);
}

TEST_F(ClientFacadeTest, InvalidConfigRegistersNothing) {
    ServerConfig cfg = scriptedConfig();
    cfg.command.clear();
    EXPECT_THROW(client->StartServer(cfg), errors::ConfigurationError);
    EXPECT_EQ(client->Registry().Size(), 0u);
}

TEST_F(ClientFacadeTest, RestartGetsFreshIdAndProjectIsRecorded) {
    const std::string first = client->StartServer(scriptedConfig(), std::string("alpha"));
    client->StopServer(first);
    const std::string second = client->StartServer(scriptedConfig(), std::string("alpha"));
    EXPECT_NE(first, second);
    auto alpha = client->Registry().ListByProject("alpha");
    ASSERT_EQ(alpha.size(), 1u);
    EXPECT_EQ(alpha[0].serverId, second);
}

TEST_F(ClientFacadeTest, ServersAreIndependent) {
    const std::string a = client->StartServer(scriptedConfig("a"));
    const std::string b = client->StartServer(scriptedConfig("b"));
    auto hang = std::async(std::launch::async, [this, &a]() {
        return client->CallTool(a, "hang", JSONValue{}, 2000ms);
    });
    JSONValue::Object args;
    args["text"] = str("b answers");
    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(echoText(client->CallTool(b, "echo", JSONValue(args))), "b answers");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1500ms);
    EXPECT_THROW(hang.get(), errors::RequestTimeoutError);
}

TEST_F(ClientFacadeTest, ShutdownAllStopsEverything) {
    client->StartServer(scriptedConfig("a"));
    client->StartServer(scriptedConfig("b"));
    client->StartServer(scriptedConfig("c"));
    EXPECT_EQ(client->Registry().Size(), 3u);
    auto failures = client->ShutdownAll();
    EXPECT_TRUE(failures.empty());
    EXPECT_EQ(client->Registry().Size(), 0u);
    EXPECT_TRUE(client->ShutdownAll().empty());
}

TEST(ValidationMode, ParseAndPrint) {
    EXPECT_EQ(validation::parseMode("strict"), validation::ValidationMode::Strict);
    EXPECT_EQ(validation::parseMode("anything"), validation::ValidationMode::Off);
    EXPECT_STREQ(validation::toString(validation::ValidationMode::Strict), "Strict");
}
