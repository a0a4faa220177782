//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Request/response correlation over a line transport
//==========================================================================================================

#include "toolhost/RequestCorrelator.h"

#include <charconv>
#include <format>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

using errors::BrokenPipeError;
using errors::RequestTimeoutError;

namespace {
// Accepts integer ids and strings holding a decimal integer.
std::optional<int64_t> numericId(const JSONValue& idVal) {
    if (std::holds_alternative<int64_t>(idVal.value)) {
        return std::get<int64_t>(idVal.value);
    }
    if (idVal.isString()) {
        const auto& s = std::get<std::string>(idVal.value);
        int64_t out = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if (ec == std::errc() && ptr == s.data() + s.size() && !s.empty()) {
            return out;
        }
    }
    return std::nullopt;
}

// Truncates long payloads for log lines.
std::string preview(const std::string& raw) {
    constexpr std::size_t limit = 200;
    if (raw.size() <= limit) {
        return raw;
    }
    return raw.substr(0, limit) + "...";
}
} // namespace

RequestCorrelator::RequestCorrelator(IProcessTransport& transport, std::string label)
    : transport_(transport), label_(std::move(label)) {}

void RequestCorrelator::writeLocked(const std::string& line) {
    // Caller holds mutex_
    try {
        transport_.WriteLine(line);
    } catch (const BrokenPipeError&) {
        throw;
    } catch (const std::invalid_argument& e) {
        throw BrokenPipeError(std::format("{}: refused to write line: {}", label_, e.what()));
    }
}

std::unique_ptr<JSONRPCResponse> RequestCorrelator::Request(const std::string& method,
                                                            const std::optional<JSONValue>& params,
                                                            std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    int64_t id = 0;
    std::future<std::unique_ptr<JSONRPCResponse>> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failedReason_.has_value()) {
            throw BrokenPipeError(failedReason_.value());
        }
        id = nextId_++;
        auto [it, inserted] = pending_.emplace(id, std::promise<std::unique_ptr<JSONRPCResponse>>{});
        future = it->second.get_future();
        JSONRPCRequest request(id, method, params);
        try {
            writeLocked(request.Serialize());
        } catch (const BrokenPipeError&) {
            pending_.erase(id);
            throw;
        }
    }
    LOG_DEBUG("{}: sent {} id={}", label_, method, id);

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = pending_.erase(id) > 0;
    }
    if (!removed) {
        // Resolved between the wait expiring and the lock; the value is on its way
        return future.get();
    }
    LOG_WARN("{}: {} id={} timed out after {} ms", label_, method, id, static_cast<long long>(timeout.count()));
    throw RequestTimeoutError(std::format("{}: {} (id={}) timed out after {} ms", label_, method, id,
                                          static_cast<long long>(timeout.count())));
}

void RequestCorrelator::Notify(const std::string& method, const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    JSONRPCNotification notification(method, params);
    std::lock_guard<std::mutex> lock(mutex_);
    if (failedReason_.has_value()) {
        throw BrokenPipeError(failedReason_.value());
    }
    writeLocked(notification.Serialize());
}

void RequestCorrelator::answerServerRequest(const JSONRPCId& id, const std::string& method) {
    auto response = CreateErrorResponse(id, JSONRPCErrorCodes::MethodNotFound,
                                        std::format("Method not found: {}", method));
    std::lock_guard<std::mutex> lock(mutex_);
    if (failedReason_.has_value()) {
        return;
    }
    try {
        writeLocked(response->Serialize());
    } catch (const BrokenPipeError& e) {
        LOG_WARN("{}: could not answer server request '{}': {}", label_, method, e.what());
    }
}

void RequestCorrelator::OnLine(const std::string& raw) {
    JSONValue root;
    try {
        root = ParseJSON(raw);
    } catch (const std::exception& e) {
        LOG_WARN("{}: dropping malformed line ({}): {}", label_, e.what(), preview(raw));
        return;
    }
    if (!root.isObject()) {
        LOG_WARN("{}: dropping non-object message: {}", label_, preview(raw));
        return;
    }

    try {
        const JSONValue* methodVal = root.find("method");
        const JSONValue* idVal = root.find("id");

        if (methodVal && methodVal->isString()) {
            const std::string& method = std::get<std::string>(methodVal->value);
            if (idVal && !idVal->isNull()) {
                LOG_INFO("{}: server sent unsupported request '{}'", label_, method);
                JSONRPCId id = std::holds_alternative<int64_t>(idVal->value)
                                   ? JSONRPCId(std::get<int64_t>(idVal->value))
                                   : (idVal->isString() ? JSONRPCId(std::get<std::string>(idVal->value))
                                                        : JSONRPCId(nullptr));
                answerServerRequest(id, method);
                return;
            }
            JSONRPCNotification notification;
            notification.method = method;
            if (const JSONValue* p = root.find("params")) {
                notification.params = *p;
            }
            LOG_DEBUG("{}: notification {}", label_, method);
            NotificationHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                handler = notificationHandler_;
            }
            if (handler) {
                handler(notification);
            }
            return;
        }

        if (!idVal) {
            LOG_WARN("{}: dropping message without id or method: {}", label_, preview(raw));
            return;
        }
        const JSONValue* resultVal = root.find("result");
        const JSONValue* errorVal = root.find("error");
        if (errorVal && errorVal->isNull()) {
            errorVal = nullptr;
        }
        if (!resultVal && !errorVal) {
            LOG_WARN("{}: dropping response without result or error: {}", label_, preview(raw));
            return;
        }
        auto id = numericId(*idVal);
        if (!id.has_value()) {
            LOG_WARN("{}: dropping response with unusable id: {}", label_, preview(raw));
            return;
        }

        auto response = std::make_unique<JSONRPCResponse>();
        response->id = id.value();
        if (errorVal) {
            if (resultVal) {
                LOG_WARN("{}: response id={} carries both result and error; using error", label_, id.value());
            }
            response->error = *errorVal;
        } else {
            response->result = *resultVal;
        }

        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id.value());
            if (it == pending_.end()) {
                LOG_WARN("{}: discarding response for unknown or expired id={}", label_, id.value());
                return;
            }
            promise = std::move(it->second);
            pending_.erase(it);
        }
        promise.set_value(std::move(response));
    } catch (const std::exception& e) {
        LOG_ERROR("{}: failed to route message ({}): {}", label_, e.what(), preview(raw));
    }
}

void RequestCorrelator::FailAll(const std::string& reason) {
    std::vector<std::promise<std::unique_ptr<JSONRPCResponse>>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failedReason_.has_value()) {
            failedReason_ = reason;
        }
        waiters.reserve(pending_.size());
        for (auto& [id, promise] : pending_) {
            waiters.push_back(std::move(promise));
        }
        pending_.clear();
    }
    if (!waiters.empty()) {
        LOG_WARN("{}: failing {} pending request(s): {}", label_, waiters.size(), reason);
    }
    for (auto& p : waiters) {
        p.set_exception(std::make_exception_ptr(BrokenPipeError(reason)));
    }
}

void RequestCorrelator::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notificationHandler_ = std::move(handler);
}

size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

int64_t RequestCorrelator::NextId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextId_;
}

} // namespace toolhost
