//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: POSIX child-process transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <format>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/ProcessTransport.hpp"
#include "toolhost/ServerConfig.h"
#include "toolhost/errors/Errors.h"

extern char** environ;

namespace toolhost {

using errors::BrokenPipeError;
using errors::SpawnError;

namespace {

std::once_flag sigpipeOnce;

// Writes to a dead child must surface as EPIPE, not kill the host.
void ignoreSigpipe() {
    std::call_once(sigpipeOnce, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool setNonBlocking(int fd) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    return fl >= 0 && ::fcntl(fd, F_SETFL, fl | O_NONBLOCK) == 0;
}

// Reported by the child through the close-on-exec status pipe.
struct ChildFailure {
    int stage;
    int err;
};
constexpr int StageRedirect = 1;
constexpr int StageChdir = 2;
constexpr int StageExec = 3;

[[noreturn]] void reportChildFailure(int fd, int stage) {
    ChildFailure f{stage, errno};
    ssize_t w = ::write(fd, &f, sizeof(f));
    (void)w;
    ::_exit(127);
}

const char* stageName(int stage) {
    switch (stage) {
        case StageRedirect: return "redirect stdio for";
        case StageChdir: return "change directory for";
        default: return "execute";
    }
}

std::vector<std::string> buildEnvironment(const ServerConfig& config) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : config.ResolvedEnvironment()) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::string describeStatus(int status) {
    if (WIFEXITED(status)) {
        return std::format("exited with code {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return std::format("killed by signal {}", WTERMSIG(status));
    }
    return std::format("ended with status {}", status);
}

std::string joinCommand(const std::vector<std::string>& command) {
    std::string out;
    for (const auto& part : command) {
        if (!out.empty()) out.push_back(' ');
        out += part;
    }
    return out;
}

} // namespace

class ProcessTransport::Impl : public std::enable_shared_from_this<ProcessTransport::Impl> {
public:
    LineHandler lineHandler;
    DiagnosticHandler diagnosticHandler;
    ExitHandler exitHandler;

    std::string label{"process"};
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};
    std::thread stdoutReader;
    std::thread stderrReader;

    std::mutex writeMutex;     // serializes WriteLine and guards stdinFd
    std::mutex lifecycleMutex; // Spawn vs Terminate
    std::mutex reapMutex;      // waitpid bookkeeping
    bool reaped{false};
    int exitStatus{0};

    std::atomic<bool> spawned{false};
    std::atomic<bool> terminating{false};
    std::atomic<bool> terminated{false};
    std::atomic<bool> stdoutClosed{false};
    std::atomic<bool> exitNotified{false};

    std::chrono::milliseconds writeTimeout{GetEnvMillisOrDefault("TOOLHOST_WRITE_TIMEOUT_MS", 5000)};
    std::chrono::milliseconds defaultGrace{DefaultTerminateGracePeriod};

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    //////////////////////////////////////////// Spawn ////////////////////////////////////////////
    void spawn(const ServerConfig& config) {
        FUNC_SCOPE();
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (spawned.load() || terminated.load()) {
            throw SpawnError(std::format("Transport for '{}' was already used", config.name));
        }
        if (config.command.empty() || config.command.front().empty()) {
            throw SpawnError(std::format("Server '{}' has an empty command", config.name));
        }
        ignoreSigpipe();
        label = config.name;
        defaultGrace = config.terminateGracePeriod;

        // Everything the child needs is built before fork()
        std::vector<std::string> envStrings = buildEnvironment(config);
        std::vector<char*> envp;
        envp.reserve(envStrings.size() + 1);
        for (auto& s : envStrings) envp.push_back(s.data());
        envp.push_back(nullptr);

        std::vector<std::string> argStrings = config.command;
        std::vector<char*> argv;
        argv.reserve(argStrings.size() + 1);
        for (auto& s : argStrings) argv.push_back(s.data());
        argv.push_back(nullptr);

        const std::string cwd = config.cwd.value_or("");

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int statusPipe[2]{-1, -1};
        auto closeAll = [&]() {
            for (int* p : {inPipe, outPipe, errPipe, statusPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };

        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(statusPipe, O_CLOEXEC) != 0) {
            int err = errno;
            closeAll();
            throw SpawnError(std::format("Failed to create pipes for '{}': {}", label, ::strerror(err)));
        }

        pid_t child = ::fork();
        if (child < 0) {
            int err = errno;
            closeAll();
            throw SpawnError(std::format("fork failed for '{}': {}", label, ::strerror(err)));
        }

        if (child == 0) {
            // Child: async-signal-safe calls only until exec
            ::setpgid(0, 0);
            struct sigaction sa {};
            sa.sa_handler = SIG_DFL;
            ::sigaction(SIGPIPE, &sa, nullptr);
            if (::dup2(inPipe[0], STDIN_FILENO) < 0 || ::dup2(outPipe[1], STDOUT_FILENO) < 0 ||
                ::dup2(errPipe[1], STDERR_FILENO) < 0) {
                reportChildFailure(statusPipe[1], StageRedirect);
            }
            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                reportChildFailure(statusPipe[1], StageChdir);
            }
            ::execvpe(argv[0], argv.data(), envp.data());
            reportChildFailure(statusPipe[1], StageExec);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(statusPipe[1]);
        // Set from both sides; EACCES after the child exec'd is harmless
        ::setpgid(child, child);

        ChildFailure failure{0, 0};
        ssize_t n;
        do {
            n = ::read(statusPipe[0], &failure, sizeof(failure));
        } while (n < 0 && errno == EINTR);
        closeFd(statusPipe[0]);

        if (n > 0) {
            int status = 0;
            while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {
            }
            closeAll();
            throw SpawnError(std::format("Failed to {} '{}' ({}): {}", stageName(failure.stage), label,
                                         joinCommand(config.command), ::strerror(failure.err)));
        }

        pid = child;
        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        for (int fd : {stdinFd, stdoutFd, stderrFd}) {
            if (!setNonBlocking(fd)) {
                LOG_WARN("ProcessTransport[{}]: failed to set O_NONBLOCK on fd {} (errno={} msg={})",
                         label, fd, errno, ::strerror(errno));
            }
        }

        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            int err = errno;
            spawned = true;
            terminateLocked(defaultGrace);
            throw SpawnError(std::format("Failed to create eventfd for '{}': {}", label, ::strerror(err)));
        }

        spawned = true;
        auto self = shared_from_this();
        stdoutReader = std::thread([self]() { self->readerLoop(self->stdoutFd, true); });
        stderrReader = std::thread([self]() { self->readerLoop(self->stderrFd, false); });
        LOG_INFO("ProcessTransport[{}]: spawned pid={} command='{}'", label, static_cast<int>(pid),
                 joinCommand(config.command));
    }

    //////////////////////////////////////////// Readers ////////////////////////////////////////////
    void readerLoop(int fd, bool isStdout) {
        const char* stream = isStdout ? "stdout" : "stderr";
        std::string buffer;
        bool discarding = false;
        bool eof = false;
        bool woke = false;

        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            LOG_ERROR("ProcessTransport[{}]: epoll_create1 failed (errno={} msg={})", label, errno, ::strerror(errno));
            eof = true;
        } else {
            epoll_event evIn{};
            evIn.events = EPOLLIN | EPOLLRDHUP;
            evIn.data.fd = fd;
            epoll_event evWake{};
            evWake.events = EPOLLIN;
            evWake.data.fd = wakeEventFd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn) != 0 ||
                ::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake) != 0) {
                LOG_ERROR("ProcessTransport[{}]: epoll_ctl failed (errno={} msg={})", label, errno, ::strerror(errno));
                eof = true;
            }
        }

        std::array<char, 8192> tmp{};
        while (!eof && !woke) {
            epoll_event events[2];
            int rc = ::epoll_wait(ep, events, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("ProcessTransport[{}]: epoll_wait failed (errno={} msg={})", label, errno, ::strerror(errno));
                eof = true;
                break;
            }
            for (int i = 0; i < rc; ++i) {
                if (events[i].data.fd == wakeEventFd) {
                    // Left unconsumed so the other reader observes it too
                    woke = true;
                    continue;
                }
                // Drain; HUP still leaves buffered output to read
                for (;;) {
                    ssize_t n = ::read(fd, tmp.data(), tmp.size());
                    if (n > 0) {
                        consume(buffer, discarding, tmp.data(), static_cast<std::size_t>(n), isStdout);
                        continue;
                    }
                    if (n == 0) {
                        eof = true;
                        break;
                    }
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno != EAGAIN && errno != EWOULDBLOCK) {
                        LOG_ERROR("ProcessTransport[{}]: {} read error (errno={} msg={})", label, stream, errno, ::strerror(errno));
                        eof = true;
                    }
                    break;
                }
            }
        }
        if (ep >= 0) {
            ::close(ep);
        }

        if (eof && !discarding && !buffer.empty()) {
            dispatchLine(buffer, isStdout);
        }
        LOG_DEBUG("ProcessTransport[{}]: {} reader exiting (eof={} woke={})", label, stream, eof, woke);
        if (isStdout && eof) {
            onStdoutEof();
        }
    }

    void consume(std::string& buffer, bool& discarding, const char* data, std::size_t n, bool isStdout) {
        std::size_t start = 0;
        for (std::size_t i = 0; i < n; ++i) {
            if (data[i] != '\n') {
                continue;
            }
            if (discarding) {
                discarding = false;
            } else {
                buffer.append(data + start, i - start);
                dispatchLine(buffer, isStdout);
            }
            buffer.clear();
            start = i + 1;
        }
        if (start < n && !discarding) {
            buffer.append(data + start, n - start);
            if (buffer.size() > ProcessTransport::MaxLineBytes) {
                LOG_WARN("ProcessTransport[{}]: discarding {} line longer than {} bytes", label,
                         isStdout ? "stdout" : "stderr", ProcessTransport::MaxLineBytes);
                buffer.clear();
                discarding = true;
            }
        }
    }

    void dispatchLine(std::string& line, bool isStdout) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > ProcessTransport::MaxLineBytes) {
            LOG_WARN("ProcessTransport[{}]: discarding line of {} bytes", label, line.size());
            return;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            return;
        }
        const auto& handler = isStdout ? lineHandler : diagnosticHandler;
        if (!handler) {
            LOG_DEBUG("ProcessTransport[{}] {}: {}", label, isStdout ? "stdout" : "stderr", line);
            return;
        }
        try {
            handler(line);
        } catch (const std::exception& e) {
            LOG_ERROR("ProcessTransport[{}]: {} handler threw: {}", label, isStdout ? "line" : "diagnostic", e.what());
        }
    }

    void onStdoutEof() {
        stdoutClosed = true;
        if (terminating.load() || exitNotified.exchange(true)) {
            return;
        }
        std::string reason = "stdout closed";
        for (int i = 0; i < 10 && !tryReap(WNOHANG); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        {
            std::lock_guard<std::mutex> lock(reapMutex);
            if (reaped) {
                reason = describeStatus(exitStatus);
            }
        }
        LOG_WARN("ProcessTransport[{}]: process ended unexpectedly ({})", label, reason);
        if (exitHandler) {
            try {
                exitHandler(reason);
            } catch (const std::exception& e) {
                LOG_ERROR("ProcessTransport[{}]: exit handler threw: {}", label, e.what());
            }
        }
    }

    //////////////////////////////////////////// Process state ////////////////////////////////////////////
    // true once the child is reaped (now or earlier)
    bool tryReap(int options) {
        std::lock_guard<std::mutex> lock(reapMutex);
        if (reaped || pid <= 0) {
            return true;
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, options);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            reaped = true;
            exitStatus = status;
            LOG_INFO("ProcessTransport[{}]: pid={} {}", label, static_cast<int>(pid), describeStatus(status));
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            reaped = true;
            return true;
        }
        return false;
    }

    void signalGroup(int sig) {
        if (::kill(-pid, sig) != 0 && errno == ESRCH) {
            ::kill(pid, sig);
        }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("ProcessTransport[{}]: eventfd write failed (errno={} msg={})", label, errno, ::strerror(errno));
            break;
        }
    }

    bool joinReader(std::thread& t) {
        if (!t.joinable()) {
            return true;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            LOG_WARN("ProcessTransport[{}]: Terminate called from a reader thread; detaching it", label);
            t.detach();
            return false;
        }
        try {
            t.join();
        } catch (const std::system_error& e) {
            LOG_ERROR("ProcessTransport[{}]: reader join failed: {}", label, e.what());
            return false;
        }
        return true;
    }

    //////////////////////////////////////////// Terminate ////////////////////////////////////////////
    void terminate(std::chrono::milliseconds grace) {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        terminateLocked(grace);
    }

    void terminateLocked(std::chrono::milliseconds grace) {
        if (terminated.exchange(true)) {
            return;
        }
        terminating = true;
        if (!spawned.load()) {
            return;
        }
        {
            std::lock_guard<std::mutex> wl(writeMutex);
            closeFd(stdinFd);
        }
        if (!tryReap(WNOHANG)) {
            signalGroup(SIGTERM);
            const auto deadline = std::chrono::steady_clock::now() + grace;
            bool gone = false;
            while (!(gone = tryReap(WNOHANG)) && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            if (!gone) {
                LOG_WARN("ProcessTransport[{}]: pid={} ignored SIGTERM for {} ms; sending SIGKILL", label,
                         static_cast<int>(pid), static_cast<long long>(grace.count()));
                signalGroup(SIGKILL);
                tryReap(0);
            }
        }
        wake();
        const bool outJoined = joinReader(stdoutReader);
        const bool errJoined = joinReader(stderrReader);
        if (outJoined && errJoined) {
            closeFd(stdoutFd);
            closeFd(stderrFd);
            closeFd(wakeEventFd);
        }
        LOG_INFO("ProcessTransport[{}]: terminated pid={}", label, static_cast<int>(pid));
    }

    //////////////////////////////////////////// Write ////////////////////////////////////////////
    void writeLine(const std::string& line) {
        if (line.find('\n') != std::string::npos) {
            throw std::invalid_argument("WriteLine: line must not contain a newline");
        }
        std::lock_guard<std::mutex> lock(writeMutex);
        if (stdinFd < 0) {
            throw BrokenPipeError(std::format("{}: stdin is closed", label));
        }
        if (stdoutClosed.load()) {
            throw BrokenPipeError(std::format("{}: process has exited", label));
        }
        std::string frame = line;
        frame.push_back('\n');
        std::size_t off = 0;
        const auto deadline = std::chrono::steady_clock::now() + writeTimeout;
        while (off < frame.size()) {
            ssize_t w = ::write(stdinFd, frame.data() + off, frame.size() - off);
            if (w > 0) {
                off += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    throw BrokenPipeError(std::format("{}: write stalled for {} ms", label,
                                                      static_cast<long long>(writeTimeout.count())));
                }
                pollfd p{};
                p.fd = stdinFd;
                p.events = POLLOUT;
                int rc = ::poll(&p, 1, static_cast<int>(remaining.count()));
                if (rc < 0 && errno != EINTR) {
                    throw BrokenPipeError(std::format("{}: poll failed: {}", label, ::strerror(errno)));
                }
                if (rc > 0 && (p.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                    throw BrokenPipeError(std::format("{}: stdin closed by process", label));
                }
                continue;
            }
            int err = errno;
            throw BrokenPipeError(std::format("{}: write failed: {}", label, ::strerror(err)));
        }
    }
};

ProcessTransport::ProcessTransport() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    pImpl->terminate(pImpl->defaultGrace);
}

void ProcessTransport::SetLineHandler(LineHandler handler) { pImpl->lineHandler = std::move(handler); }
void ProcessTransport::SetDiagnosticHandler(DiagnosticHandler handler) { pImpl->diagnosticHandler = std::move(handler); }
void ProcessTransport::SetExitHandler(ExitHandler handler) { pImpl->exitHandler = std::move(handler); }

void ProcessTransport::Spawn(const ServerConfig& config) {
    pImpl->spawn(config);
}

void ProcessTransport::Terminate(std::chrono::milliseconds gracePeriod) {
    FUNC_SCOPE();
    pImpl->terminate(gracePeriod);
}

bool ProcessTransport::IsAlive() const {
    return pImpl->spawned.load() && !pImpl->tryReap(WNOHANG);
}

std::optional<int> ProcessTransport::GetPid() const {
    if (pImpl->pid <= 0) {
        return std::nullopt;
    }
    return static_cast<int>(pImpl->pid);
}

void ProcessTransport::WriteLine(const std::string& line) {
    pImpl->writeLine(line);
}

std::unique_ptr<IProcessTransport> ProcessTransportFactory::CreateTransport(const ServerConfig& config) {
    LOG_DEBUG("Creating ProcessTransport for '{}'", config.name);
    return std::make_unique<ProcessTransport>();
}

} // namespace toolhost
