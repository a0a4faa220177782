//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "toolhost/InMemoryTransport.hpp"
#include "toolhost/ServerConfig.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
enum class EventKind { Line, Diagnostic, Exit };

struct Event {
    EventKind kind;
    std::string text;
};
} // namespace

class InMemoryTransport::Impl {
public:
    LineHandler lineHandler;
    DiagnosticHandler diagnosticHandler;
    ExitHandler exitHandler;

    std::mutex peerMutex;
    PeerHandler peer;

    std::mutex queueMutex;
    std::condition_variable_any queueCondition;
    std::deque<Event> events;
    std::jthread processingThread;

    mutable std::mutex stateMutex;
    std::string label{"memory"};
    std::optional<std::string> spawnFailure;
    std::optional<int> pid;
    std::vector<std::string> written;
    std::atomic<bool> alive{false};
    std::atomic<bool> terminated{false};
    std::atomic<bool> exitQueued{false};

    ~Impl() {
        stopProcessing();
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                Event ev;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    if (!queueCondition.wait(lock, st, [this]() { return !events.empty(); })) {
                        break;
                    }
                    ev = std::move(events.front());
                    events.pop_front();
                }
                deliver(ev);
            }
        });
    }

    void stopProcessing() {
        if (!processingThread.joinable()) {
            return;
        }
        processingThread.request_stop();
        queueCondition.notify_all();
        if (processingThread.get_id() == std::this_thread::get_id()) {
            LOG_WARN("InMemoryTransport[{}]: stopped from its own reader thread; detaching", label);
            processingThread.detach();
            return;
        }
        processingThread.join();
    }

    void enqueue(EventKind kind, std::string text) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            events.push_back(Event{kind, std::move(text)});
        }
        queueCondition.notify_one();
    }

    void deliver(const Event& ev) {
        try {
            switch (ev.kind) {
                case EventKind::Line:
                    if (lineHandler) lineHandler(ev.text);
                    break;
                case EventKind::Diagnostic:
                    if (diagnosticHandler) {
                        diagnosticHandler(ev.text);
                    } else {
                        LOG_DEBUG("InMemoryTransport[{}] stderr: {}", label, ev.text);
                    }
                    break;
                case EventKind::Exit:
                    if (!terminated.load() && exitHandler) exitHandler(ev.text);
                    break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("InMemoryTransport[{}]: handler threw: {}", label, e.what());
        }
    }
};

InMemoryTransport::InMemoryTransport(PeerHandler peer) : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->peer = std::move(peer);
}

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    Terminate(std::chrono::milliseconds(0));
}

void InMemoryTransport::SetLineHandler(LineHandler handler) { pImpl->lineHandler = std::move(handler); }
void InMemoryTransport::SetDiagnosticHandler(DiagnosticHandler handler) { pImpl->diagnosticHandler = std::move(handler); }
void InMemoryTransport::SetExitHandler(ExitHandler handler) { pImpl->exitHandler = std::move(handler); }

void InMemoryTransport::Spawn(const ServerConfig& config) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->label = config.name;
        if (pImpl->spawnFailure.has_value()) {
            std::string msg = std::move(pImpl->spawnFailure.value());
            pImpl->spawnFailure.reset();
            throw errors::SpawnError(msg);
        }
        if (pImpl->alive.load() || pImpl->terminated.load()) {
            throw errors::SpawnError(std::format("Transport for '{}' was already used", config.name));
        }
    }
    pImpl->alive = true;
    pImpl->startProcessing();
    LOG_DEBUG("InMemoryTransport[{}]: spawned", config.name);
}

void InMemoryTransport::Terminate(std::chrono::milliseconds /*gracePeriod*/) {
    if (pImpl->terminated.exchange(true)) {
        return;
    }
    pImpl->alive = false;
    pImpl->stopProcessing();
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        pImpl->events.clear();
    }
    LOG_DEBUG("InMemoryTransport[{}]: terminated", pImpl->label);
}

bool InMemoryTransport::IsAlive() const {
    return pImpl->alive.load();
}

std::optional<int> InMemoryTransport::GetPid() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->pid;
}

void InMemoryTransport::WriteLine(const std::string& line) {
    if (line.find('\n') != std::string::npos) {
        throw std::invalid_argument("WriteLine: line must not contain a newline");
    }
    if (!pImpl->alive.load()) {
        throw errors::BrokenPipeError(std::format("{}: process is not running", pImpl->label));
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->written.push_back(line);
    }
    PeerHandler peer;
    {
        std::lock_guard<std::mutex> lock(pImpl->peerMutex);
        peer = pImpl->peer;
    }
    if (peer) {
        peer(line, *this);
    }
}

void InMemoryTransport::SetPeer(PeerHandler peer) {
    std::lock_guard<std::mutex> lock(pImpl->peerMutex);
    pImpl->peer = std::move(peer);
}

void InMemoryTransport::DeliverLine(const std::string& line) {
    pImpl->enqueue(EventKind::Line, line);
}

void InMemoryTransport::DeliverDiagnostic(const std::string& line) {
    pImpl->enqueue(EventKind::Diagnostic, line);
}

void InMemoryTransport::SimulateExit(const std::string& reason) {
    pImpl->alive = false;
    if (pImpl->exitQueued.exchange(true)) {
        return;
    }
    pImpl->enqueue(EventKind::Exit, reason);
}

void InMemoryTransport::FailNextSpawn(const std::string& message) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->spawnFailure = message;
}

void InMemoryTransport::SetPid(int pid) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->pid = pid;
}

std::size_t InMemoryTransport::GetWriteCount() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->written.size();
}

std::vector<std::string> InMemoryTransport::GetWrittenLines() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->written;
}

bool InMemoryTransport::WasTerminated() const {
    return pImpl->terminated.load();
}

InMemoryTransportFactory::InMemoryTransportFactory(CreateHook onCreate) : onCreate_(std::move(onCreate)) {}

std::unique_ptr<IProcessTransport> InMemoryTransportFactory::CreateTransport(const ServerConfig& config) {
    auto transport = std::make_unique<InMemoryTransport>();
    if (onCreate_) {
        onCreate_(*transport, config);
    }
    return transport;
}

} // namespace toolhost
