//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Matches JSON-RPC responses from one tool server to the callers waiting on them
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// RequestCorrelator
// Purpose: Per-server request/response correlation.
// Notes:
//   - Ids are int64 values starting at 1 and are never reused.
//   - Allocating the id, registering the pending entry and writing the line happen under one mutex,
//     so a response can never arrive before its entry exists and lines never interleave.
//   - Waiting happens on a per-request future with no lock held.
//   - OnLine() is fed by the transport's stdout reader and never throws.
//==========================================================================================================
class RequestCorrelator {
public:
    using NotificationHandler = std::function<void(const JSONRPCNotification& notification)>;

    // label names the server in log lines.
    RequestCorrelator(IProcessTransport& transport, std::string label);

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //==========================================================================================================
    // Request
    // Purpose: Sends method/params and blocks until the matching response, timeout or failure.
    // Returns:
    //   The response; callers inspect IsError() for JSON-RPC errors.
    // Throws:
    //   errors::RequestTimeoutError when timeout elapses (the pending entry is removed first).
    //   errors::BrokenPipeError when the write fails or FailAll() runs while waiting.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Request(const std::string& method,
                                             const std::optional<JSONValue>& params,
                                             std::chrono::milliseconds timeout);

    // Writes a notification under the same mutex as requests. Throws errors::BrokenPipeError.
    void Notify(const std::string& method, const std::optional<JSONValue>& params = std::nullopt);

    //==========================================================================================================
    // OnLine
    // Purpose: Routes one raw stdout line.
    //   response (id + result/error) -> fulfils the pending waiter; unknown ids are logged and dropped
    //   notification (method, no id)  -> logged and passed to the notification handler
    //   request (method + id)         -> answered with -32601 Method not found
    //   anything else                 -> logged and dropped
    //==========================================================================================================
    void OnLine(const std::string& raw);

    //==========================================================================================================
    // FailAll
    // Purpose: Resolves every outstanding waiter with errors::BrokenPipeError(reason). Later Request()
    //          and Notify() calls fail immediately with the same reason.
    //==========================================================================================================
    void FailAll(const std::string& reason);

    void SetNotificationHandler(NotificationHandler handler);

    size_t PendingCount() const;
    int64_t NextId() const;

private:
    void writeLocked(const std::string& line);
    void answerServerRequest(const JSONRPCId& id, const std::string& method);

    IProcessTransport& transport_;
    std::string label_;

    mutable std::mutex mutex_;
    int64_t nextId_{1};
    std::unordered_map<int64_t, std::promise<std::unique_ptr<JSONRPCResponse>>> pending_;
    std::optional<std::string> failedReason_;
    NotificationHandler notificationHandler_;
};

} // namespace toolhost
