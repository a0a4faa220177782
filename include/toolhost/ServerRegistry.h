//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.h
// Purpose: Thread-safe directory of known tool servers, their status and discovered tools
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "toolhost/Protocol.h"

namespace toolhost {

//==========================================================================================================
// ServerRegistry
// Purpose: In-memory record store keyed by server id. Holds state only; performs no process or
//          pipe I/O. Every accessor takes the single internal mutex and returns deep copies, so callers
//          never observe a record mid-update.
// Errors:
//   Mutating or reading an id that was never registered (or was removed) throws
//   errors::UnknownServerError.
//==========================================================================================================
class ServerRegistry {
public:
    ServerRegistry() = default;
    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    //==========================================================================================================
    // Register
    // Purpose: Mints a fresh random UUID and inserts a record in Starting status.
    // Returns:
    //   The new server id. Ids are never reused, including ids of removed records.
    //==========================================================================================================
    std::string Register(const std::string& name, const std::optional<std::string>& projectName = std::nullopt);

    // Sets status and replaces errorMessage (cleared when error is std::nullopt).
    void SetStatus(const std::string& serverId, ServerStatus status,
                   const std::optional<std::string>& error = std::nullopt);

    //==========================================================================================================
    // CompareAndSetStatus
    // Purpose: Atomically moves the record to desired when its current status equals expected.
    // Returns:
    //   true when the transition happened; false when the record is absent or in another status.
    //==========================================================================================================
    bool CompareAndSetStatus(const std::string& serverId, ServerStatus expected, ServerStatus desired,
                             const std::optional<std::string>& error = std::nullopt);

    void SetPid(const std::string& serverId, int pid);
    void SetTools(const std::string& serverId, std::vector<Tool> tools);

    ServerInfo Get(const std::string& serverId) const;
    std::vector<Tool> GetTools(const std::string& serverId) const;
    std::vector<ServerInfo> ListAll() const;
    std::vector<ServerInfo> ListByStatus(ServerStatus status) const;
    std::vector<ServerInfo> ListByProject(const std::string& projectName) const;

    bool Contains(const std::string& serverId) const;
    size_t Size() const;

    // Deletes the record; throws errors::UnknownServerError when absent.
    void Remove(const std::string& serverId);

private:
    ServerInfo& require(const std::string& serverId);
    const ServerInfo& require(const std::string& serverId) const;
    std::string mintId();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ServerInfo> servers_;
    std::unordered_set<std::string> retiredIds_;
};

} // namespace toolhost
