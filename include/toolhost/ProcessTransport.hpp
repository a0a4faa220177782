//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: POSIX child-process transport speaking newline-delimited messages over stdio pipes
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include <memory>

namespace toolhost {

//==========================================================================================================
// ProcessTransport
// Purpose: fork/exec based IProcessTransport.
// Notes:
//   - The child runs in its own process group so Terminate() reaches helpers it forks.
//   - Environment is the host environment plus the config's resolved overrides.
//   - stdout and stderr each get a reader thread (epoll + eventfd wake-up).
//   - Lines longer than MaxLineBytes are discarded with a warning.
//   - TOOLHOST_WRITE_TIMEOUT_MS bounds how long WriteLine() waits on a full pipe (default 5000).
//==========================================================================================================
class ProcessTransport : public IProcessTransport {
public:
    static constexpr std::size_t MaxLineBytes = 4 * 1024 * 1024;

    ProcessTransport();
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    void SetLineHandler(LineHandler handler) override;
    void SetDiagnosticHandler(DiagnosticHandler handler) override;
    void SetExitHandler(ExitHandler handler) override;

    void Spawn(const ServerConfig& config) override;
    void Terminate(std::chrono::milliseconds gracePeriod) override;
    bool IsAlive() const override;
    std::optional<int> GetPid() const override;

    void WriteLine(const std::string& line) override;

private:
    class Impl;
    // Shared with the reader threads so a reader that outlives a self-initiated Terminate()
    // still owns the descriptors it polls.
    std::shared_ptr<Impl> pImpl;
};

class ProcessTransportFactory : public IProcessTransportFactory {
public:
    std::unique_ptr<IProcessTransport> CreateTransport(const ServerConfig& config) override;
};

} // namespace toolhost
