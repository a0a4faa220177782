//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Launch configuration for tool-server processes, named templates and config-file loading
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

//==========================================================================================================
// Default timeouts. TOOLHOST_INIT_TIMEOUT_MS and TOOLHOST_REQUEST_TIMEOUT_MS override the
// initialize and per-request defaults for every config constructed afterwards.
//==========================================================================================================
std::chrono::milliseconds DefaultInitTimeout();
std::chrono::milliseconds DefaultRequestTimeout();
constexpr std::chrono::milliseconds DefaultShutdownTimeout{5000};
constexpr std::chrono::milliseconds DefaultTerminateGracePeriod{3000};

//==========================================================================================================
// ServerConfig
// Purpose: Describes how to launch one tool server.
// Fields:
//   name: Human-readable server name (also the registry record name).
//   command: argv vector; command[0] is resolved through PATH.
//   description: Free text shown in status listings.
//   env: Variables added on top of the host environment. Values may reference ${VAR} / $VAR,
//        substituted from the host environment at spawn time.
//   cwd: Working directory of the child; inherits the host's when unset.
//   initTimeout: Bound on the initialize round trip.
//   requestTimeout: Default bound for tools/list and tools/call.
//   shutdownTimeout: Bound on the best-effort shutdown request during StopServer.
//   terminateGracePeriod: Wait between SIGTERM and SIGKILL.
//==========================================================================================================
struct ServerConfig {
    std::string name;
    std::vector<std::string> command;
    std::string description;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;
    std::chrono::milliseconds initTimeout{DefaultInitTimeout()};
    std::chrono::milliseconds requestTimeout{DefaultRequestTimeout()};
    std::chrono::milliseconds shutdownTimeout{DefaultShutdownTimeout};
    std::chrono::milliseconds terminateGracePeriod{DefaultTerminateGracePeriod};

    // env with every value passed through ExpandEnvReferences.
    std::map<std::string, std::string> ResolvedEnvironment() const;
};

// Throws errors::ConfigurationError when name or command is empty or a timeout is not positive.
void ValidateServerConfig(const ServerConfig& config);

//==========================================================================================================
// ServerConfigOverrides
// Purpose: Field-wise replacements applied on top of a template by BuildConfig. Unset fields keep
//          the template value; a set env replaces the template's env entirely.
//==========================================================================================================
struct ServerConfigOverrides {
    std::optional<std::string> name;
    std::optional<std::vector<std::string>> command;
    std::optional<std::string> description;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<std::string> cwd;
    std::optional<std::chrono::milliseconds> initTimeout;
    std::optional<std::chrono::milliseconds> requestTimeout;
    std::optional<std::chrono::milliseconds> shutdownTimeout;
    std::optional<std::chrono::milliseconds> terminateGracePeriod;
};

//==========================================================================================================
// OverridesFromJSON
// Purpose: Reads overrides from an object with keys name, command (array), description, env (object),
//          cwd, initTimeoutMs, requestTimeoutMs, shutdownTimeoutMs, terminateGracePeriodMs.
//          Unknown keys are logged and ignored.
// Throws:
//   errors::ConfigurationError when a known key has the wrong type.
//==========================================================================================================
ServerConfigOverrides OverridesFromJSON(const JSONValue& value);

// Names of the built-in templates: "filesystem", "airtable", "postgresql".
std::vector<std::string> TemplateNames();

// Returns a copy of a built-in template; throws errors::ConfigurationError for unknown names.
ServerConfig GetTemplate(const std::string& templateName);

//==========================================================================================================
// BuildConfig
// Purpose: Template copy plus optional root (working directory for the filesystem template) plus
//          overrides. Environment references stay unresolved until spawn.
// Throws:
//   errors::ConfigurationError for an unknown template or a resulting config that fails validation.
//==========================================================================================================
ServerConfig BuildConfig(const std::string& templateName,
                         const std::optional<std::string>& root = std::nullopt,
                         const ServerConfigOverrides& overrides = ServerConfigOverrides{});

//==========================================================================================================
// ParseServerConfigs / LoadServerConfigs
// Purpose: Reads the conventional servers file:
//   { "mcpServers": { "<name>": { "command": "npx", "args": ["-y", "pkg"], "env": {..},
//                                 "cwd": "/path", "initTimeoutMs": 15000, "requestTimeoutMs": 20000 } } }
//   Results are ordered by server name.
// Throws:
//   errors::ConfigurationError when the file is unreadable, not JSON, or an entry is malformed.
//==========================================================================================================
std::vector<ServerConfig> ParseServerConfigs(const JSONValue& document);
std::vector<ServerConfig> LoadServerConfigs(const std::string& path);

} // namespace toolhost
