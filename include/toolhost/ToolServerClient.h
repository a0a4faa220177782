//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServerClient.h
// Purpose: Public facade for starting, querying, invoking and stopping tool servers
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/ServerRegistry.h"
#include "toolhost/Transport.h"
#include "toolhost/validation/Validation.h"

namespace toolhost {

class RequestCorrelator;

//==========================================================================================================
// ToolServerClient
// Purpose: The only operations surface collaborators use. Each started server gets its own
//          transport and correlator; state lives in the registry.
// Lifecycle:
//   starting -> ready | error ; ready -> stopped | error. Stopped records are removed; error records
//   stay queryable until StopServer() or ShutdownAll().
// Thread-safety:
//   All methods may be called concurrently. Calls against different servers never block each other
//   beyond short registry/context lookups.
//==========================================================================================================
class ToolServerClient {
public:
    explicit ToolServerClient(std::shared_ptr<IProcessTransportFactory> factory = nullptr,
                              validation::ValidationMode mode = validation::ValidationMode::Off);
    ~ToolServerClient();

    ToolServerClient(const ToolServerClient&) = delete;
    ToolServerClient& operator=(const ToolServerClient&) = delete;

    //==========================================================================================================
    // StartServer
    // Purpose: Spawns the server, performs initialize, sends notifications/initialized, discovers tools
    //          (following nextCursor pages) and marks the server ready.
    // Returns:
    //   The new server id.
    // Throws:
    //   errors::ConfigurationError (config rejected before anything is registered),
    //   errors::SpawnError, errors::InitializationTimeoutError, errors::DiscoveryTimeoutError,
    //   errors::HandshakeError, errors::BrokenPipeError. On any failure after registration the
    //   process is terminated and the record is left in error with the reason.
    //==========================================================================================================
    std::string StartServer(const ServerConfig& config,
                            const std::optional<std::string>& projectName = std::nullopt);

    //==========================================================================================================
    // StopServer
    // Purpose: Best-effort shutdown request, then unconditional termination; the record is removed.
    // Throws:
    //   errors::UnknownServerError when the id is not known.
    //==========================================================================================================
    void StopServer(const std::string& serverId);

    // Discovered tools (registry copy, no I/O). Throws errors::UnknownServerError.
    std::vector<Tool> ListTools(const std::string& serverId) const;

    //==========================================================================================================
    // CallTool
    // Purpose: Invokes tools/call {name, arguments} and returns the raw result object.
    // Args:
    //   arguments: JSON object (null is sent as {}).
    //   timeout: Overrides the server's requestTimeout.
    // Throws:
    //   errors::UnknownServerError, errors::ServerNotReadyError (nothing written),
    //   errors::ToolCallError (server error, or rejected locally: non-object arguments; in Strict mode
    //   unknown tool / missing required arguments), errors::RequestTimeoutError,
    //   errors::BrokenPipeError (server moves to error).
    //==========================================================================================================
    JSONValue CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& arguments,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ServerStatus GetStatus(const std::string& serverId) const;
    ServerInfo GetInfo(const std::string& serverId) const;

    //==========================================================================================================
    // ShutdownAll
    // Purpose: Stops every known server.
    // Returns:
    //   One message per server that could not be stopped cleanly; empty on full success.
    //==========================================================================================================
    std::vector<std::string> ShutdownAll();

    ServerRegistry& Registry() { return registry_; }
    const ServerRegistry& Registry() const { return registry_; }

    void SetValidationMode(validation::ValidationMode mode) { mode_.store(mode); }
    validation::ValidationMode GetValidationMode() const { return mode_.load(); }

private:
    struct ServerContext;

    std::shared_ptr<ServerContext> findContext(const std::string& serverId) const;
    void wireHandlers(const std::shared_ptr<ServerContext>& ctx);
    void initialize(ServerContext& ctx);
    std::vector<Tool> discoverTools(ServerContext& ctx);
    void failStart(ServerContext& ctx, const std::string& reason);
    void stopContext(const std::shared_ptr<ServerContext>& ctx);

    std::shared_ptr<IProcessTransportFactory> factory_;
    std::atomic<validation::ValidationMode> mode_;
    ServerRegistry registry_;

    mutable std::mutex contextsMutex_;
    std::unordered_map<std::string, std::shared_ptr<ServerContext>> contexts_;
};

} // namespace toolhost
