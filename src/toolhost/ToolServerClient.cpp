//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServerClient.cpp
// Purpose: Tool-server lifecycle orchestration on top of transport, correlator and registry
//==========================================================================================================

#include "toolhost/ToolServerClient.h"

#include <format>
#include <unordered_set>

#include "logging/Logger.h"
#include "toolhost/ProcessTransport.hpp"
#include "toolhost/RequestCorrelator.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/validation/Validators.h"
#include "toolhost/version.h"

namespace toolhost {

struct ToolServerClient::ServerContext {
    std::string serverId;
    ServerConfig config;
    std::unique_ptr<IProcessTransport> transport; // null when the factory failed
    std::unique_ptr<RequestCorrelator> correlator; // declared after transport: destroyed first
    std::atomic<bool> stopping{false};
    std::mutex stopMutex;
    bool stopped{false};
};

namespace {
errors::McpError invalidParams(const std::string& message) {
    errors::McpError e;
    e.code = JSONRPCErrorCodes::InvalidParams;
    e.message = message;
    e.category = errors::ErrorCategory::JsonRpcInvalidParams;
    return e;
}

std::string shortId(const std::string& serverId) {
    return serverId.substr(0, 8);
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}
} // namespace

ToolServerClient::ToolServerClient(std::shared_ptr<IProcessTransportFactory> factory, validation::ValidationMode mode)
    : factory_(factory ? std::move(factory) : std::make_shared<ProcessTransportFactory>()), mode_(mode) {
    FUNC_SCOPE();
}

ToolServerClient::~ToolServerClient() {
    FUNC_SCOPE();
    try {
        for (const auto& failure : ShutdownAll()) {
            LOG_WARN("ToolServerClient shutdown: {}", failure);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("ToolServerClient shutdown failed: {}", e.what());
    }
}

std::shared_ptr<ToolServerClient::ServerContext> ToolServerClient::findContext(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(contextsMutex_);
    auto it = contexts_.find(serverId);
    if (it == contexts_.end()) {
        throw errors::UnknownServerError(serverId);
    }
    return it->second;
}

void ToolServerClient::wireHandlers(const std::shared_ptr<ServerContext>& ctx) {
    std::weak_ptr<ServerContext> weak = ctx;
    const std::string logName = std::format("{}|{}", ctx->config.name, shortId(ctx->serverId));

    ctx->transport->SetLineHandler([weak](const std::string& line) {
        if (auto c = weak.lock()) {
            c->correlator->OnLine(line);
        }
    });
    ctx->transport->SetDiagnosticHandler([logName](const std::string& line) {
        LOG_DEBUG("[{}|stderr] {}", logName, line);
    });
    // Runs on the stdout reader thread; must not call Terminate
    ctx->transport->SetExitHandler([this, weak](const std::string& reason) {
        auto c = weak.lock();
        if (!c) {
            return;
        }
        c->correlator->FailAll(std::format("Server '{}' exited: {}", c->config.name, reason));
        if (c->stopping.load()) {
            return;
        }
        registry_.CompareAndSetStatus(c->serverId, ServerStatus::Ready, ServerStatus::Error,
                                      std::format("Server process exited unexpectedly ({})", reason));
    });
}

std::string ToolServerClient::StartServer(const ServerConfig& config, const std::optional<std::string>& projectName) {
    FUNC_SCOPE();
    ValidateServerConfig(config);
    const std::string id = registry_.Register(config.name, projectName);

    auto ctx = std::make_shared<ServerContext>();
    ctx->serverId = id;
    ctx->config = config;
    try {
        ctx->transport = factory_->CreateTransport(config);
        if (!ctx->transport) {
            throw errors::SpawnError(std::format("No transport available for '{}'", config.name));
        }
    } catch (const std::exception& e) {
        registry_.SetStatus(id, ServerStatus::Error, e.what());
        // Transport-less context so StopServer and ShutdownAll can still retire the record
        ctx->transport.reset();
        ctx->stopping = true;
        {
            std::lock_guard<std::mutex> lock(contextsMutex_);
            contexts_.emplace(id, ctx);
        }
        throw;
    }
    ctx->correlator = std::make_unique<RequestCorrelator>(*ctx->transport,
                                                          std::format("{}[{}]", config.name, shortId(id)));
    wireHandlers(ctx);
    {
        std::lock_guard<std::mutex> lock(contextsMutex_);
        contexts_.emplace(id, ctx);
    }

    try {
        ctx->transport->Spawn(config);
        if (auto pid = ctx->transport->GetPid()) {
            registry_.SetPid(id, pid.value());
        }
        initialize(*ctx);
        ctx->correlator->Notify(Methods::Initialized);
        auto tools = discoverTools(*ctx);
        const size_t toolCount = tools.size();
        registry_.SetTools(id, std::move(tools));
        if (!registry_.CompareAndSetStatus(id, ServerStatus::Starting, ServerStatus::Ready)) {
            throw errors::HandshakeError(std::format("Server '{}' left the starting state during startup", config.name));
        }
        LOG_INFO("Server '{}' ready (id={}, tools={})", config.name, id, toolCount);
        return id;
    } catch (const std::exception& e) {
        failStart(*ctx, e.what());
        throw;
    }
}

void ToolServerClient::failStart(ServerContext& ctx, const std::string& reason) {
    LOG_ERROR("Server '{}' failed to start: {}", ctx.config.name, reason);
    ctx.stopping = true;
    ctx.transport->Terminate(ctx.config.terminateGracePeriod);
    ctx.correlator->FailAll(reason);
    try {
        registry_.SetStatus(ctx.serverId, ServerStatus::Error, reason);
    } catch (const errors::UnknownServerError&) {
        LOG_DEBUG("Server {} was removed while starting", ctx.serverId);
    }
}

void ToolServerClient::initialize(ServerContext& ctx) {
    JSONValue::Object clientInfo;
    clientInfo["name"] = std::make_shared<JSONValue>(CLIENT_NAME);
    clientInfo["version"] = std::make_shared<JSONValue>(getVersionString());
    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    params["clientInfo"] = std::make_shared<JSONValue>(std::move(clientInfo));

    std::unique_ptr<JSONRPCResponse> resp;
    try {
        resp = ctx.correlator->Request(Methods::Initialize, JSONValue(std::move(params)), ctx.config.initTimeout);
    } catch (const errors::RequestTimeoutError&) {
        throw errors::InitializationTimeoutError(std::format("Server '{}' did not answer initialize within {} ms",
                                                             ctx.config.name,
                                                             static_cast<long long>(ctx.config.initTimeout.count())));
    }
    if (resp->IsError()) {
        auto err = errors::mcpErrorFromResponse(*resp);
        throw errors::HandshakeError(std::format("Server '{}' rejected initialize ({}): {}", ctx.config.name,
                                                 err->code, err->message));
    }
    if (!resp->result.has_value() || !resp->result->isObject()) {
        if (mode_.load() == validation::ValidationMode::Strict) {
            throw errors::HandshakeError(std::format("Server '{}' returned a non-object initialize result", ctx.config.name));
        }
        LOG_WARN("Server '{}' returned a non-object initialize result", ctx.config.name);
        return;
    }
    const JSONValue& result = resp->result.value();
    std::string serverName = "?";
    std::string serverVersion = "?";
    if (const JSONValue* info = result.find("serverInfo")) {
        if (const JSONValue* n = info->find("name"); n && n->isString()) serverName = std::get<std::string>(n->value);
        if (const JSONValue* v = info->find("version"); v && v->isString()) serverVersion = std::get<std::string>(v->value);
    }
    std::string negotiated = "?";
    if (const JSONValue* pv = result.find("protocolVersion"); pv && pv->isString()) {
        negotiated = std::get<std::string>(pv->value);
    }
    LOG_INFO("Server '{}' initialized: {} {} (protocol {})", ctx.config.name, serverName, serverVersion, negotiated);
}

std::vector<Tool> ToolServerClient::discoverTools(ServerContext& ctx) {
    std::vector<Tool> tools;
    std::unordered_set<std::string> names;
    std::unordered_set<std::string> seenCursors;
    std::optional<std::string> cursor;

    for (;;) {
        JSONValue::Object params;
        if (cursor.has_value()) {
            params["cursor"] = std::make_shared<JSONValue>(cursor.value());
        }
        std::unique_ptr<JSONRPCResponse> resp;
        try {
            resp = ctx.correlator->Request(Methods::ListTools, JSONValue(std::move(params)), ctx.config.requestTimeout);
        } catch (const errors::RequestTimeoutError&) {
            throw errors::DiscoveryTimeoutError(std::format("Server '{}' did not answer tools/list within {} ms",
                                                            ctx.config.name,
                                                            static_cast<long long>(ctx.config.requestTimeout.count())));
        }
        if (resp->IsError()) {
            auto err = errors::mcpErrorFromResponse(*resp);
            throw errors::HandshakeError(std::format("Server '{}' rejected tools/list ({}): {}", ctx.config.name,
                                                     err->code, err->message));
        }
        const JSONValue result = resp->result.value_or(JSONValue{});
        if (mode_.load() == validation::ValidationMode::Strict && !validation::validateToolsListResultJson(result)) {
            throw errors::HandshakeError(std::format("Server '{}' returned an invalid tools/list result", ctx.config.name));
        }
        ToolsPage page;
        try {
            page = ParseToolsPage(result);
        } catch (const std::invalid_argument& e) {
            throw errors::HandshakeError(std::format("Server '{}': {}", ctx.config.name, e.what()));
        }
        if (page.skipped > 0) {
            LOG_WARN("Server '{}': skipped {} tool entr(ies) without a name", ctx.config.name, page.skipped);
        }
        for (auto& tool : page.tools) {
            if (!names.insert(tool.name).second) {
                LOG_WARN("Server '{}': duplicate tool '{}' ignored", ctx.config.name, tool.name);
                continue;
            }
            tools.push_back(std::move(tool));
        }
        if (!page.nextCursor.has_value()) {
            break;
        }
        if (!seenCursors.insert(page.nextCursor.value()).second) {
            LOG_WARN("Server '{}': tools/list repeated cursor '{}'; stopping pagination", ctx.config.name,
                     page.nextCursor.value());
            break;
        }
        cursor = page.nextCursor;
    }
    return tools;
}

void ToolServerClient::stopContext(const std::shared_ptr<ServerContext>& ctx) {
    std::lock_guard<std::mutex> lock(ctx->stopMutex);
    if (ctx->stopped) {
        throw errors::UnknownServerError(ctx->serverId);
    }
    ctx->stopping = true;
    if (ctx->transport && ctx->transport->IsAlive()) {
        try {
            auto resp = ctx->correlator->Request(Methods::Shutdown, JSONValue(JSONValue::Object{}),
                                                 ctx->config.shutdownTimeout);
            if (resp->IsError()) {
                LOG_DEBUG("Server '{}' answered shutdown with an error", ctx->config.name);
            }
        } catch (const errors::ToolHostError& e) {
            LOG_DEBUG("Server '{}' did not acknowledge shutdown: {}", ctx->config.name, e.what());
        }
    }
    if (ctx->transport) {
        ctx->transport->Terminate(ctx->config.terminateGracePeriod);
        ctx->correlator->FailAll(std::format("Server '{}' was stopped", ctx->config.name));
    }
    try {
        registry_.SetStatus(ctx->serverId, ServerStatus::Stopped);
        registry_.Remove(ctx->serverId);
    } catch (const errors::UnknownServerError&) {
        LOG_DEBUG("Server {} was already removed", ctx->serverId);
    }
    ctx->stopped = true;
    {
        std::lock_guard<std::mutex> mapLock(contextsMutex_);
        contexts_.erase(ctx->serverId);
    }
    LOG_INFO("Server '{}' stopped (id={})", ctx->config.name, ctx->serverId);
}

void ToolServerClient::StopServer(const std::string& serverId) {
    FUNC_SCOPE();
    stopContext(findContext(serverId));
}

std::vector<Tool> ToolServerClient::ListTools(const std::string& serverId) const {
    return registry_.GetTools(serverId);
}

JSONValue ToolServerClient::CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& arguments,
                                     std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    auto ctx = findContext(serverId);
    const ServerInfo info = registry_.Get(serverId);
    if (info.status != ServerStatus::Ready) {
        throw errors::ServerNotReadyError(std::format("Server '{}' ({}) is not ready (status={})", info.name, serverId,
                                                      toString(info.status)));
    }
    JSONValue args = arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments;
    if (!args.isObject()) {
        throw errors::ToolCallError(invalidParams("Tool arguments must be a JSON object"));
    }
    if (mode_.load() == validation::ValidationMode::Strict) {
        auto tool = validation::findTool(info.tools, toolName);
        if (!tool.has_value()) {
            throw errors::ToolCallError(invalidParams(std::format("Unknown tool '{}' on server '{}'", toolName, info.name)));
        }
        auto missing = validation::missingRequiredArguments(tool.value(), args);
        if (!missing.empty()) {
            throw errors::ToolCallError(invalidParams(std::format("Missing required argument(s) for '{}': {}", toolName,
                                                                  joinNames(missing))));
        }
    }

    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(toolName);
    params["arguments"] = std::make_shared<JSONValue>(std::move(args));

    std::unique_ptr<JSONRPCResponse> resp;
    try {
        resp = ctx->correlator->Request(Methods::CallTool, JSONValue(std::move(params)),
                                        timeout.value_or(ctx->config.requestTimeout));
    } catch (const errors::BrokenPipeError& e) {
        if (!ctx->stopping.load()) {
            registry_.CompareAndSetStatus(serverId, ServerStatus::Ready, ServerStatus::Error, e.what());
        }
        throw;
    }
    if (resp->IsError()) {
        throw errors::ToolCallError(errors::mcpErrorFromResponse(*resp).value());
    }
    return resp->result.value_or(JSONValue{});
}

ServerStatus ToolServerClient::GetStatus(const std::string& serverId) const {
    return registry_.Get(serverId).status;
}

ServerInfo ToolServerClient::GetInfo(const std::string& serverId) const {
    return registry_.Get(serverId);
}

std::vector<std::string> ToolServerClient::ShutdownAll() {
    FUNC_SCOPE();
    std::vector<std::shared_ptr<ServerContext>> all;
    {
        std::lock_guard<std::mutex> lock(contextsMutex_);
        all.reserve(contexts_.size());
        for (const auto& [id, ctx] : contexts_) {
            all.push_back(ctx);
        }
    }
    std::vector<std::string> failures;
    for (const auto& ctx : all) {
        try {
            stopContext(ctx);
        } catch (const errors::UnknownServerError&) {
            LOG_DEBUG("Server {} stopped concurrently", ctx->serverId);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to stop server {}: {}", ctx->serverId, e.what());
            failures.push_back(std::format("{}: {}", ctx->serverId, e.what()));
        }
    }
    return failures;
}

} // namespace toolhost
