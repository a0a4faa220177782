//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Process transport interfaces - line-oriented I/O with one spawned tool-server process
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace toolhost {

struct ServerConfig;

//==========================================================================================================
// IProcessTransport
// Purpose: Owns one child process and its three pipes. Outgoing traffic is whole lines; incoming
//          stdout lines are protocol traffic, stderr lines are diagnostics only.
// Notes:
//   - Handlers must be installed before Spawn(); they run on the transport's reader threads.
//   - WriteLine() is safe to call from several threads; each line is written whole.
//==========================================================================================================
class IProcessTransport {
public:
    virtual ~IProcessTransport() = default;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Invoked once per non-blank stdout line (trailing '\r' stripped).
    using LineHandler = std::function<void(const std::string& line)>;
    // Invoked once per non-blank stderr line.
    using DiagnosticHandler = std::function<void(const std::string& line)>;
    // Invoked at most once when stdout reaches EOF before Terminate() was requested.
    using ExitHandler = std::function<void(const std::string& reason)>;

    virtual void SetLineHandler(LineHandler handler) = 0;
    virtual void SetDiagnosticHandler(DiagnosticHandler handler) = 0;
    virtual void SetExitHandler(ExitHandler handler) = 0;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the process described by config and its reader threads.
    // Throws:
    //   errors::SpawnError when the process cannot be started; nothing is left running.
    //==========================================================================================================
    virtual void Spawn(const ServerConfig& config) = 0;

    //==========================================================================================================
    // Closes stdin, asks the process (group) to exit, escalates after gracePeriod, reaps it and
    // stops the readers. Idempotent; never throws.
    //==========================================================================================================
    virtual void Terminate(std::chrono::milliseconds gracePeriod) = 0;

    virtual bool IsAlive() const = 0;
    virtual std::optional<int> GetPid() const = 0;

    /////////////////////////////////////////// I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Writes line followed by '\n'.
    // Throws:
    //   errors::BrokenPipeError when the process is gone, stdin is closed or the write stalls.
    //   std::invalid_argument when line contains a newline.
    //==========================================================================================================
    virtual void WriteLine(const std::string& line) = 0;
};

//==========================================================================================================
// IProcessTransportFactory
// Purpose: Creates one transport per server start; lets the client run against real processes or
//          in-process doubles.
//==========================================================================================================
class IProcessTransportFactory {
public:
    virtual ~IProcessTransportFactory() = default;
    virtual std::unique_ptr<IProcessTransport> CreateTransport(const ServerConfig& config) = 0;
};

} // namespace toolhost
