//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process transport double for tests and embedding
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

//==========================================================================================================
// InMemoryTransport
// Purpose: IProcessTransport whose "process" is a peer callback running in-process. Every written
//          line is handed to the peer; the peer answers through DeliverLine()/DeliverDiagnostic().
//          Delivered output reaches the handlers on the transport's own reader thread, in order,
//          exactly as a real process's stdout reader would.
//==========================================================================================================
class InMemoryTransport : public IProcessTransport {
public:
    // Invoked synchronously from WriteLine() with the line (without '\n').
    using PeerHandler = std::function<void(const std::string& line, InMemoryTransport& transport)>;

    explicit InMemoryTransport(PeerHandler peer = PeerHandler{});
    ~InMemoryTransport() override;

    InMemoryTransport(const InMemoryTransport&) = delete;
    InMemoryTransport& operator=(const InMemoryTransport&) = delete;

    ////////////////////////////////////////// IProcessTransport //////////////////////////////////////////
    void SetLineHandler(LineHandler handler) override;
    void SetDiagnosticHandler(DiagnosticHandler handler) override;
    void SetExitHandler(ExitHandler handler) override;

    void Spawn(const ServerConfig& config) override;
    void Terminate(std::chrono::milliseconds gracePeriod) override;
    bool IsAlive() const override;
    std::optional<int> GetPid() const override;
    void WriteLine(const std::string& line) override;

    ////////////////////////////////////////// Peer side //////////////////////////////////////////
    // Replaces the peer callback; safe to call at any time.
    void SetPeer(PeerHandler peer);

    // Queues a stdout line for the line handler.
    void DeliverLine(const std::string& line);

    // Queues a stderr line for the diagnostic handler.
    void DeliverDiagnostic(const std::string& line);

    //==========================================================================================================
    // SimulateExit
    // Purpose: Marks the process dead; once previously queued lines are delivered the exit handler
    //          runs with reason. Later writes fail with errors::BrokenPipeError.
    //==========================================================================================================
    void SimulateExit(const std::string& reason = "simulated exit");

    // Makes the next Spawn() throw errors::SpawnError with message.
    void FailNextSpawn(const std::string& message);

    // Reported by GetPid() after a successful Spawn().
    void SetPid(int pid);

    std::size_t GetWriteCount() const;
    std::vector<std::string> GetWrittenLines() const;
    bool WasTerminated() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// InMemoryTransportFactory
// Purpose: Creates InMemoryTransports for a client. onCreate runs for every new transport so the
//          caller can install a peer and keep a pointer for later inspection.
//==========================================================================================================
class InMemoryTransportFactory : public IProcessTransportFactory {
public:
    using CreateHook = std::function<void(InMemoryTransport& transport, const ServerConfig& config)>;

    explicit InMemoryTransportFactory(CreateHook onCreate = CreateHook{});
    std::unique_ptr<IProcessTransport> CreateTransport(const ServerConfig& config) override;

private:
    CreateHook onCreate_;
};

} // namespace toolhost
