//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: GoogleTests for the child-process transport and the client against a real tool server process
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ProcessTransport.hpp"
#include "toolhost/ServerConfig.h"
#include "toolhost/ToolServerClient.h"
#include "toolhost/errors/Errors.h"

#ifndef TOOLHOST_TEST_FIXTURE_PATH
#error "TOOLHOST_TEST_FIXTURE_PATH must point at the echo_tool_server binary"
#endif

using namespace toolhost;
using namespace std::chrono_literals;

namespace {

ServerConfig fixtureConfig(std::vector<std::string> extraArgs = {}) {
    ServerConfig cfg;
    cfg.name = "echo-fixture";
    cfg.command = {TOOLHOST_TEST_FIXTURE_PATH};
    for (auto& a : extraArgs) cfg.command.push_back(std::move(a));
    cfg.initTimeout = 5000ms;
    cfg.requestTimeout = 5000ms;
    cfg.shutdownTimeout = 1000ms;
    cfg.terminateGracePeriod = 1000ms;
    return cfg;
}

JSONValue args(std::initializer_list<std::pair<const char*, JSONValue>> items) {
    JSONValue::Object o;
    for (const auto& [k, v] : items) {
        o[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue(std::move(o));
}

std::string textOf(const JSONValue& result) {
    const auto& content = std::get<JSONValue::Array>(result.find("content")->value);
    return std::get<std::string>(content.at(0)->find("text")->value);
}

} // namespace

TEST(ProcessTransport, MissingBinaryIsSpawnError) {
    ProcessTransport transport;
    ServerConfig cfg;
    cfg.name = "ghost";
    cfg.command = {"/nonexistent/definitely-not-a-tool-server"};
    try {
        transport.Spawn(cfg);
        FAIL() << "expected SpawnError";
    } catch (const errors::SpawnError& e) {
        EXPECT_NE(std::string(e.what()).find("ghost"), std::string::npos);
    }
    EXPECT_FALSE(transport.IsAlive());
    EXPECT_FALSE(transport.GetPid().has_value());
}

TEST(ProcessTransport, SplitsStdoutLinesAndForwardsStderr) {
    ProcessTransport transport;
    std::mutex m;
    std::vector<std::string> lines;
    std::promise<std::string> diag;
    std::promise<std::string> exited;
    transport.SetLineHandler([&m, &lines](const std::string& l) {
        std::lock_guard<std::mutex> lock(m);
        lines.push_back(l);
    });
    transport.SetDiagnosticHandler([&diag](const std::string& l) { diag.set_value(l); });
    transport.SetExitHandler([&exited](const std::string& reason) { exited.set_value(reason); });

    ServerConfig cfg;
    cfg.name = "sh";
    cfg.command = {"/bin/sh", "-c", "printf 'first\\r\\n\\nsecond\\n'; echo oops >&2; exit 0"};
    transport.Spawn(cfg);
    ASSERT_TRUE(transport.GetPid().has_value());
    EXPECT_GT(transport.GetPid().value(), 0);

    auto df = diag.get_future();
    auto ef = exited.get_future();
    ASSERT_EQ(df.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(df.get(), "oops");
    ASSERT_EQ(ef.wait_for(5s), std::future_status::ready);
    EXPECT_NE(ef.get().find("code 0"), std::string::npos);
    {
        std::lock_guard<std::mutex> lock(m);
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_EQ(lines[0], "first");
        EXPECT_EQ(lines[1], "second");
    }
    EXPECT_FALSE(transport.IsAlive());
    EXPECT_THROW(transport.WriteLine("{}"), errors::BrokenPipeError);
    transport.Terminate(100ms);
}

TEST(ProcessTransport, TerminateEscalatesWhenSigtermIsIgnored) {
    ProcessTransport transport;
    std::atomic<bool> exitReported{false};
    transport.SetExitHandler([&exitReported](const std::string&) { exitReported = true; });
    transport.Spawn(fixtureConfig({"--ignore-sigterm", "--silent"}));
    ASSERT_TRUE(transport.IsAlive());
    // Give the child time to install its handler
    std::this_thread::sleep_for(100ms);

    const auto started = std::chrono::steady_clock::now();
    transport.Terminate(200ms);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    EXPECT_FALSE(transport.IsAlive());
    EXPECT_FALSE(exitReported.load());
    transport.Terminate(200ms);
}

TEST(ProcessClient, EndToEndWithRealServer) {
    ::setenv("TOOLHOST_TEST_HOST_VALUE", "from-host", 1);
    ToolServerClient client;
    ServerConfig cfg = fixtureConfig();
    cfg.env = {{"FIXTURE_GREETING", "hello ${TOOLHOST_TEST_HOST_VALUE}"}};
    cfg.cwd = "/";

    const std::string id = client.StartServer(cfg, std::string("e2e"));
    ServerInfo info = client.GetInfo(id);
    EXPECT_EQ(info.status, ServerStatus::Ready);
    ASSERT_TRUE(info.pid.has_value());
    EXPECT_GT(info.pid.value(), 0);
    EXPECT_EQ(info.tools.size(), 7u);

    EXPECT_EQ(textOf(client.CallTool(id, "echo", args({{"text", JSONValue(std::string("ping"))}}))), "ping");
    EXPECT_EQ(textOf(client.CallTool(id, "add", args({{"a", JSONValue(static_cast<int64_t>(2))},
                                                       {"b", JSONValue(static_cast<int64_t>(40))}}))),
              "42");
    EXPECT_EQ(textOf(client.CallTool(id, "env", args({{"name", JSONValue(std::string("FIXTURE_GREETING"))}}))),
              "hello from-host");
    // Host environment is inherited alongside the configured entries
    EXPECT_EQ(textOf(client.CallTool(id, "env", args({{"name", JSONValue(std::string("TOOLHOST_TEST_HOST_VALUE"))}}))),
              "from-host");
    EXPECT_EQ(textOf(client.CallTool(id, "cwd", JSONValue{})), "/");

    try {
        client.CallTool(id, "fail", JSONValue{});
        FAIL() << "expected ToolCallError";
    } catch (const errors::ToolCallError& e) {
        EXPECT_EQ(e.code(), -32000);
    }
    EXPECT_EQ(client.GetStatus(id), ServerStatus::Ready);

    client.StopServer(id);
    EXPECT_THROW(client.GetStatus(id), errors::UnknownServerError);
    ::unsetenv("TOOLHOST_TEST_HOST_VALUE");
}

TEST(ProcessClient, ConcurrentCallsCompleteOutOfOrder) {
    ToolServerClient client;
    const std::string id = client.StartServer(fixtureConfig());
    auto slow = std::async(std::launch::async, [&client, &id]() {
        return textOf(client.CallTool(id, "sleep", args({{"ms", JSONValue(static_cast<int64_t>(400))}})));
    });
    auto fast = std::async(std::launch::async, [&client, &id]() {
        return textOf(client.CallTool(id, "sleep", args({{"ms", JSONValue(static_cast<int64_t>(10))}})));
    });
    ASSERT_EQ(fast.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(fast.get(), "slept 10");
    EXPECT_EQ(slow.get(), "slept 400");
}

TEST(ProcessClient, SilentServerTimesOutDuringInitialize) {
    ToolServerClient client;
    ServerConfig cfg = fixtureConfig({"--silent"});
    cfg.initTimeout = 200ms;
    cfg.terminateGracePeriod = 500ms;
    const auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client.StartServer(cfg), errors::InitializationTimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
    auto errored = client.Registry().ListByStatus(ServerStatus::Error);
    ASSERT_EQ(errored.size(), 1u);
    ASSERT_TRUE(errored[0].errorMessage.has_value());
}

TEST(ProcessClient, MissingBinaryLeavesErrorRecord) {
    ToolServerClient client;
    ServerConfig cfg = fixtureConfig();
    cfg.command = {"/nonexistent/definitely-not-a-tool-server"};
    EXPECT_THROW(client.StartServer(cfg), errors::SpawnError);
    auto errored = client.Registry().ListByStatus(ServerStatus::Error);
    ASSERT_EQ(errored.size(), 1u);
    EXPECT_TRUE(client.ShutdownAll().empty());
    EXPECT_EQ(client.Registry().Size(), 0u);
}

TEST(ProcessClient, CrashMovesServerToError) {
    ToolServerClient client;
    const std::string id = client.StartServer(fixtureConfig());
    EXPECT_THROW(client.CallTool(id, "crash", JSONValue{}, 5000ms), errors::BrokenPipeError);
    EXPECT_EQ(client.GetStatus(id), ServerStatus::Error);
    EXPECT_THROW(client.CallTool(id, "echo", args({{"text", JSONValue(std::string("x"))}})),
                 errors::ServerNotReadyError);
    client.StopServer(id);
}

TEST(ProcessClient, PagedDiscoveryAndNoisyStartup) {
    ToolServerClient client;
    const std::string id = client.StartServer(fixtureConfig({"--paged", "--noise"}));
    auto tools = client.ListTools(id);
    ASSERT_EQ(tools.size(), 7u);
    std::set<std::string> names;
    for (const auto& t : tools) names.insert(t.name);
    EXPECT_EQ(names.size(), 7u);
    EXPECT_TRUE(names.count("echo"));
    EXPECT_TRUE(names.count("crash"));
    EXPECT_TRUE(client.ShutdownAll().empty());
}
