//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Server config defaults, templates, overrides and config-file parsing
//==========================================================================================================

#include "toolhost/ServerConfig.h"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

using errors::ConfigurationError;

std::chrono::milliseconds DefaultInitTimeout() {
    return std::chrono::milliseconds(GetEnvMillisOrDefault("TOOLHOST_INIT_TIMEOUT_MS", 15000));
}

std::chrono::milliseconds DefaultRequestTimeout() {
    return std::chrono::milliseconds(GetEnvMillisOrDefault("TOOLHOST_REQUEST_TIMEOUT_MS", 20000));
}

std::map<std::string, std::string> ServerConfig::ResolvedEnvironment() const {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : env) {
        out[key] = ExpandEnvReferences(value);
    }
    return out;
}

void ValidateServerConfig(const ServerConfig& config) {
    if (config.name.empty()) {
        throw ConfigurationError("Server config has an empty name");
    }
    if (config.command.empty() || config.command.front().empty()) {
        throw ConfigurationError(std::format("Server config '{}' has an empty command", config.name));
    }
    if (config.initTimeout.count() <= 0 || config.requestTimeout.count() <= 0) {
        throw ConfigurationError(std::format("Server config '{}' has a non-positive timeout", config.name));
    }
    if (config.shutdownTimeout.count() < 0 || config.terminateGracePeriod.count() < 0) {
        throw ConfigurationError(std::format("Server config '{}' has a negative shutdown wait", config.name));
    }
}

namespace {

const std::string& requireString(const JSONValue& v, const std::string& key) {
    if (!v.isString()) {
        throw ConfigurationError(std::format("'{}' must be a string", key));
    }
    return std::get<std::string>(v.value);
}

std::vector<std::string> requireStringArray(const JSONValue& v, const std::string& key) {
    if (!v.isArray()) {
        throw ConfigurationError(std::format("'{}' must be an array of strings", key));
    }
    std::vector<std::string> out;
    for (const auto& item : std::get<JSONValue::Array>(v.value)) {
        if (!item || !item->isString()) {
            throw ConfigurationError(std::format("'{}' must be an array of strings", key));
        }
        out.push_back(std::get<std::string>(item->value));
    }
    return out;
}

std::map<std::string, std::string> requireStringMap(const JSONValue& v, const std::string& key) {
    if (!v.isObject()) {
        throw ConfigurationError(std::format("'{}' must be an object of strings", key));
    }
    std::map<std::string, std::string> out;
    for (const auto& [k, item] : std::get<JSONValue::Object>(v.value)) {
        if (!item || !item->isString()) {
            throw ConfigurationError(std::format("'{}.{}' must be a string", key, k));
        }
        out[k] = std::get<std::string>(item->value);
    }
    return out;
}

std::chrono::milliseconds requireMillis(const JSONValue& v, const std::string& key) {
    if (std::holds_alternative<int64_t>(v.value)) {
        return std::chrono::milliseconds(std::get<int64_t>(v.value));
    }
    if (std::holds_alternative<double>(v.value)) {
        return std::chrono::milliseconds(static_cast<int64_t>(std::get<double>(v.value)));
    }
    throw ConfigurationError(std::format("'{}' must be a number of milliseconds", key));
}

ServerConfig makeTemplate(const std::string& name, const std::string& package, const std::string& description,
                          std::map<std::string, std::string> env = {}) {
    ServerConfig config;
    config.name = name;
    config.command = {"npx", "-y", package};
    config.description = description;
    config.env = std::move(env);
    return config;
}

} // namespace

ServerConfigOverrides OverridesFromJSON(const JSONValue& value) {
    ServerConfigOverrides o;
    if (value.isNull()) {
        return o;
    }
    if (!value.isObject()) {
        throw ConfigurationError("Overrides must be a JSON object");
    }
    for (const auto& [key, item] : std::get<JSONValue::Object>(value.value)) {
        if (!item) {
            continue;
        }
        if (key == "name") {
            o.name = requireString(*item, key);
        } else if (key == "command") {
            o.command = requireStringArray(*item, key);
        } else if (key == "description") {
            o.description = requireString(*item, key);
        } else if (key == "env") {
            o.env = requireStringMap(*item, key);
        } else if (key == "cwd") {
            o.cwd = requireString(*item, key);
        } else if (key == "initTimeoutMs") {
            o.initTimeout = requireMillis(*item, key);
        } else if (key == "requestTimeoutMs") {
            o.requestTimeout = requireMillis(*item, key);
        } else if (key == "shutdownTimeoutMs") {
            o.shutdownTimeout = requireMillis(*item, key);
        } else if (key == "terminateGracePeriodMs") {
            o.terminateGracePeriod = requireMillis(*item, key);
        } else {
            LOG_WARN("Ignoring unknown config override '{}'", key);
        }
    }
    return o;
}

std::vector<std::string> TemplateNames() {
    return {"airtable", "filesystem", "postgresql"};
}

ServerConfig GetTemplate(const std::string& templateName) {
    if (templateName == "filesystem") {
        return makeTemplate("filesystem", "@modelcontextprotocol/server-filesystem",
                            "Local filesystem operations");
    }
    if (templateName == "airtable") {
        return makeTemplate("airtable", "@modelcontextprotocol/server-airtable",
                            "Airtable operations",
                            {{"AIRTABLE_API_KEY", "${AIRTABLE_API_KEY}"},
                             {"AIRTABLE_BASE_ID", "${AIRTABLE_BASE_ID}"}});
    }
    if (templateName == "postgresql") {
        return makeTemplate("postgresql", "@modelcontextprotocol/server-postgres",
                            "PostgreSQL operations",
                            {{"POSTGRES_URL", "${POSTGRES_URL}"}});
    }
    throw ConfigurationError(std::format("Unknown server template: {}", templateName));
}

ServerConfig BuildConfig(const std::string& templateName,
                         const std::optional<std::string>& root,
                         const ServerConfigOverrides& overrides) {
    ServerConfig config = GetTemplate(templateName);
    if (templateName == "filesystem" && root.has_value() && !root->empty()) {
        config.cwd = root;
    }
    if (overrides.name) config.name = *overrides.name;
    if (overrides.command) config.command = *overrides.command;
    if (overrides.description) config.description = *overrides.description;
    if (overrides.env) config.env = *overrides.env;
    if (overrides.cwd) config.cwd = *overrides.cwd;
    if (overrides.initTimeout) config.initTimeout = *overrides.initTimeout;
    if (overrides.requestTimeout) config.requestTimeout = *overrides.requestTimeout;
    if (overrides.shutdownTimeout) config.shutdownTimeout = *overrides.shutdownTimeout;
    if (overrides.terminateGracePeriod) config.terminateGracePeriod = *overrides.terminateGracePeriod;
    ValidateServerConfig(config);
    return config;
}

std::vector<ServerConfig> ParseServerConfigs(const JSONValue& document) {
    const JSONValue* servers = document.find("mcpServers");
    if (!servers || !servers->isObject()) {
        throw ConfigurationError("Config document has no \"mcpServers\" object");
    }
    std::vector<ServerConfig> configs;
    for (const auto& [name, entry] : std::get<JSONValue::Object>(servers->value)) {
        if (!entry || !entry->isObject()) {
            throw ConfigurationError(std::format("Server entry '{}' must be an object", name));
        }
        ServerConfig config;
        config.name = name;
        const JSONValue* cmd = entry->find("command");
        if (!cmd) {
            throw ConfigurationError(std::format("Server entry '{}' has no command", name));
        }
        config.command.push_back(requireString(*cmd, name + ".command"));
        if (const JSONValue* args = entry->find("args")) {
            for (auto& a : requireStringArray(*args, name + ".args")) {
                config.command.push_back(std::move(a));
            }
        }
        if (const JSONValue* d = entry->find("description")) config.description = requireString(*d, name + ".description");
        if (const JSONValue* e = entry->find("env")) config.env = requireStringMap(*e, name + ".env");
        if (const JSONValue* c = entry->find("cwd")) config.cwd = requireString(*c, name + ".cwd");
        if (const JSONValue* t = entry->find("initTimeoutMs")) config.initTimeout = requireMillis(*t, name + ".initTimeoutMs");
        if (const JSONValue* t = entry->find("requestTimeoutMs")) config.requestTimeout = requireMillis(*t, name + ".requestTimeoutMs");
        ValidateServerConfig(config);
        configs.push_back(std::move(config));
    }
    std::sort(configs.begin(), configs.end(),
              [](const ServerConfig& a, const ServerConfig& b) { return a.name < b.name; });
    return configs;
}

std::vector<ServerConfig> LoadServerConfigs(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigurationError(std::format("Cannot open server config file: {}", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    JSONValue document;
    try {
        document = ParseJSON(buffer.str());
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(std::format("Invalid JSON in {}: {}", path, e.what()));
    }
    auto configs = ParseServerConfigs(document);
    LOG_INFO("Loaded {} server config(s) from {}", configs.size(), path);
    return configs;
}

} // namespace toolhost
