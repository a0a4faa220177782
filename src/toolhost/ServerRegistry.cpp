//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.cpp
// Purpose: Thread-safe tool-server registry implementation
//==========================================================================================================

#include "toolhost/ServerRegistry.h"

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
void sortByStart(std::vector<ServerInfo>& infos) {
    std::sort(infos.begin(), infos.end(), [](const ServerInfo& a, const ServerInfo& b) {
        if (a.startedAt != b.startedAt) return a.startedAt < b.startedAt;
        return a.serverId < b.serverId;
    });
}

std::vector<Tool> cloneTools(const std::vector<Tool>& tools) {
    std::vector<Tool> out;
    out.reserve(tools.size());
    for (const auto& t : tools) {
        out.push_back(CloneTool(t));
    }
    return out;
}

// Copies share no JSON nodes with the stored record
ServerInfo snapshot(const ServerInfo& info) {
    ServerInfo out = info;
    out.tools = cloneTools(info.tools);
    return out;
}
} // namespace

std::string ServerRegistry::mintId() {
    // Caller holds mutex_
    static thread_local boost::uuids::random_generator gen;
    std::string id;
    do {
        id = boost::uuids::to_string(gen());
    } while (servers_.count(id) != 0 || retiredIds_.count(id) != 0);
    return id;
}

std::string ServerRegistry::Register(const std::string& name, const std::optional<std::string>& projectName) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex_);
    ServerInfo info;
    info.serverId = mintId();
    info.name = name;
    info.projectName = projectName;
    info.status = ServerStatus::Starting;
    info.startedAt = std::chrono::system_clock::now();
    const std::string id = info.serverId;
    servers_.emplace(id, std::move(info));
    LOG_INFO("Server registered: {} name={} project={}", id, name, projectName.value_or("-"));
    return id;
}

void ServerRegistry::SetStatus(const std::string& serverId, ServerStatus status,
                               const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    ServerInfo& info = require(serverId);
    info.status = status;
    info.errorMessage = error;
    if (error.has_value()) {
        LOG_ERROR("Server {} status={}: {}", serverId, toString(status), error.value());
    } else {
        LOG_INFO("Server {} status={}", serverId, toString(status));
    }
}

bool ServerRegistry::CompareAndSetStatus(const std::string& serverId, ServerStatus expected, ServerStatus desired,
                                         const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(serverId);
    if (it == servers_.end() || it->second.status != expected) {
        return false;
    }
    it->second.status = desired;
    it->second.errorMessage = error;
    if (error.has_value()) {
        LOG_ERROR("Server {} status {} -> {}: {}", serverId, toString(expected), toString(desired), error.value());
    } else {
        LOG_INFO("Server {} status {} -> {}", serverId, toString(expected), toString(desired));
    }
    return true;
}

void ServerRegistry::SetPid(const std::string& serverId, int pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    require(serverId).pid = pid;
    LOG_DEBUG("Server {} assigned pid={}", serverId, pid);
}

void ServerRegistry::SetTools(const std::string& serverId, std::vector<Tool> tools) {
    std::lock_guard<std::mutex> lock(mutex_);
    ServerInfo& info = require(serverId);
    info.tools = cloneTools(tools);
    LOG_INFO("Server {} tools discovered: {}", serverId, info.tools.size());
}

ServerInfo ServerRegistry::Get(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot(require(serverId));
}

std::vector<Tool> ServerRegistry::GetTools(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cloneTools(require(serverId).tools);
}

std::vector<ServerInfo> ServerRegistry::ListAll() const {
    std::vector<ServerInfo> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(servers_.size());
        for (const auto& [id, info] : servers_) {
            out.push_back(snapshot(info));
        }
    }
    sortByStart(out);
    return out;
}

std::vector<ServerInfo> ServerRegistry::ListByStatus(ServerStatus status) const {
    std::vector<ServerInfo> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, info] : servers_) {
            if (info.status == status) out.push_back(snapshot(info));
        }
    }
    sortByStart(out);
    return out;
}

std::vector<ServerInfo> ServerRegistry::ListByProject(const std::string& projectName) const {
    std::vector<ServerInfo> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, info] : servers_) {
            if (info.projectName.has_value() && info.projectName.value() == projectName) out.push_back(snapshot(info));
        }
    }
    sortByStart(out);
    return out;
}

bool ServerRegistry::Contains(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.count(serverId) != 0;
}

size_t ServerRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.size();
}

void ServerRegistry::Remove(const std::string& serverId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = servers_.find(serverId);
    if (it == servers_.end()) {
        throw errors::UnknownServerError(serverId);
    }
    servers_.erase(it);
    retiredIds_.insert(serverId);
    LOG_INFO("Server removed from registry: {}", serverId);
}

ServerInfo& ServerRegistry::require(const std::string& serverId) {
    auto it = servers_.find(serverId);
    if (it == servers_.end()) {
        throw errors::UnknownServerError(serverId);
    }
    return it->second;
}

const ServerInfo& ServerRegistry::require(const std::string& serverId) const {
    auto it = servers_.find(serverId);
    if (it == servers_.end()) {
        throw errors::UnknownServerError(serverId);
    }
    return it->second;
}

} // namespace toolhost
