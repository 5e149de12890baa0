//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeTransport.cpp
// Purpose: Child-process transport: fork/exec with pipes, newline framing, poll-based reader
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <array>
#include <atomic>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcphub/LineFramer.h"
#include "mcphub/PipeTransport.hpp"

extern char** environ;

namespace mcphub {

namespace {

void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        // Writes to an exited child must surface as EPIPE, not kill the process
        ::signal(SIGPIPE, SIG_IGN);
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Inherited environment with config entries overriding same-named variables.
std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& kv : overrides) {
            if (kv.first == key) { overridden = true; break; }
        }
        if (!overridden) {
            out.push_back(std::move(entry));
        }
    }
    for (const auto& kv : overrides) {
        out.push_back(kv.first + "=" + kv.second);
    }
    return out;
}

} // namespace

class PipeTransport::Impl {
public:
    Options opts;
    pid_t childPid{-1};
    int writeFd{-1};     // child's stdin
    int readFd{-1};      // child's stdout
    int wakeEventFd{-1};
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> peerClosed{false};
    std::mutex writeMutex;
    std::mutex lifecycleMutex;
    LineFramer framer;
    bool eof{false};
    std::string sessionId{"pipe-unstarted"};

    explicit Impl(const Options& o) : opts(o), framer(o.maxLineLength) {}

    ~Impl() {
        closeFd(writeFd);
        closeFd(readFd);
        closeFd(wakeEventFd);
    }

    void spawn() {
        if (opts.command.empty()) {
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed, "PipeTransport: empty command");
        }
        ignoreSigpipeOnce();

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int execPipe[2]{-1, -1};
        auto cleanup = [&]() {
            for (int* fd : {&inPipe[0], &inPipe[1], &outPipe[0], &outPipe[1], &execPipe[0], &execPipe[1]}) {
                closeFd(*fd);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
            int err = errno;
            cleanup();
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                       std::string("PipeTransport: pipe2 failed: ") + ::strerror(err));
        }

        // Everything the child needs is prepared before fork(); only async-signal-safe calls follow it
        std::vector<std::string> argStorage;
        argStorage.push_back(opts.command);
        argStorage.insert(argStorage.end(), opts.args.begin(), opts.args.end());
        std::vector<char*> argv;
        for (auto& a : argStorage) argv.push_back(a.data());
        argv.push_back(nullptr);
        std::vector<std::string> envStorage = buildEnvironment(opts.env);
        std::vector<char*> envp;
        for (auto& e : envStorage) envp.push_back(e.data());
        envp.push_back(nullptr);
        const char* cwd = opts.cwd.empty() ? nullptr : opts.cwd.c_str();

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            cleanup();
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                       std::string("PipeTransport: fork failed: ") + ::strerror(err));
        }
        if (pid == 0) {
            // Child: dup2 clears FD_CLOEXEC on the standard descriptors
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            if (cwd != nullptr && ::chdir(cwd) != 0) {
                int err = errno;
                (void)!::write(execPipe[1], &err, sizeof(err));
                ::_exit(127);
            }
            ::execvpe(argv[0], argv.data(), envp.data());
            int err = errno;
            (void)!::write(execPipe[1], &err, sizeof(err));
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(execPipe[1]);

        // exec succeeded when the CLOEXEC pipe closes without data
        int childErr = 0;
        ssize_t n;
        do { n = ::read(execPipe[0], &childErr, sizeof(childErr)); } while (n < 0 && errno == EINTR);
        closeFd(execPipe[0]);
        if (n == static_cast<ssize_t>(sizeof(childErr))) {
            int status = 0;
            (void)::waitpid(pid, &status, 0);
            closeFd(inPipe[1]);
            closeFd(outPipe[0]);
            throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                       "PipeTransport: cannot launch '" + opts.command + "': " + ::strerror(childErr));
        }

        childPid = pid;
        writeFd = inPipe[1];
        readFd = outPipe[0];
        int flags = ::fcntl(readFd, F_GETFL, 0);
        if (flags >= 0) { (void)::fcntl(readFd, F_SETFL, flags | O_NONBLOCK); }
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("PipeTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        sessionId = "pipe-" + std::to_string(pid);
    }

    void wakeReader() {
        if (wakeEventFd >= 0) {
            uint64_t one = 1;
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w < 0 && errno != EAGAIN) {
                LOG_WARN("PipeTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
    }

    bool waitChild(std::chrono::milliseconds grace) {
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (true) {
            int status = 0;
            pid_t r = ::waitpid(childPid, &status, WNOHANG);
            if (r == childPid || (r < 0 && errno == ECHILD)) {
                if (r == childPid) {
                    if (WIFEXITED(status)) {
                        LOG_DEBUG("PipeTransport: child {} exited with status {}", childPid, WEXITSTATUS(status));
                    } else if (WIFSIGNALED(status)) {
                        LOG_DEBUG("PipeTransport: child {} terminated by signal {}", childPid, WTERMSIG(status));
                    }
                }
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void terminateChild() {
        if (childPid <= 0) {
            return;
        }
        if (!waitChild(opts.terminateGrace)) {
            LOG_DEBUG("PipeTransport: sending SIGTERM to child {}", childPid);
            ::kill(childPid, SIGTERM);
            if (!waitChild(opts.terminateGrace)) {
                LOG_WARN("PipeTransport: child {} ignored SIGTERM; sending SIGKILL", childPid);
                ::kill(childPid, SIGKILL);
                int status = 0;
                (void)::waitpid(childPid, &status, 0);
            }
        }
        childPid = -1;
    }
};

PipeTransport::PipeTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

PipeTransport::~PipeTransport() {
    try {
        Close().get();
    } catch (const std::exception& e) {
        LOG_ERROR("PipeTransport: close during destruction failed: {}", e.what());
    }
}

std::future<void> PipeTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    try {
        pImpl->spawn();
        pImpl->connected = true;
        LOG_INFO("PipeTransport: started '{}' (pid {})", pImpl->opts.command, pImpl->childPid);
        ready.set_value();
    } catch (const errors::McpException& e) {
        LOG_ERROR("{}", e.what());
        ready.set_exception(std::current_exception());
    }
    return fut;
}

std::future<void> PipeTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    if (!pImpl->closing.exchange(true)) {
        pImpl->connected = false;
        pImpl->wakeReader();
        // EOF on stdin lets a well-behaved server exit on its own; skip if a writer is mid-write
        {
            std::unique_lock<std::mutex> wl(pImpl->writeMutex, std::try_to_lock);
            if (wl.owns_lock()) {
                closeFd(pImpl->writeFd);
            }
        }
        pImpl->terminateChild();
        {
            std::lock_guard<std::mutex> wl(pImpl->writeMutex);
            closeFd(pImpl->writeFd);
        }
        LOG_DEBUG("PipeTransport: {} closed", pImpl->sessionId);
    }
    done.set_value();
    return fut;
}

bool PipeTransport::IsConnected() const {
    return pImpl->connected && !pImpl->peerClosed;
}

std::string PipeTransport::GetSessionId() const {
    return pImpl->sessionId;
}

int PipeTransport::GetChildPid() const {
    return static_cast<int>(pImpl->childPid);
}

void PipeTransport::Send(const Envelope& envelope) {
    FUNC_SCOPE();
    std::string frame = LineFramer::encode(envelope.Encode());
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    if (pImpl->closing || pImpl->peerClosed || pImpl->writeFd < 0) {
        throw errors::McpException(JSONRPCErrorCodes::TransportClosed, "PipeTransport: transport closed");
    }
    LOG_DEBUG("PipeTransport[{}] send: {}", pImpl->sessionId, frame.substr(0, frame.size() - 1));
    std::size_t off = 0;
    while (off < frame.size()) {
        ssize_t n = ::write(pImpl->writeFd, frame.data() + off, frame.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            pImpl->peerClosed = true;
            throw errors::McpException(JSONRPCErrorCodes::TransportClosed,
                                       std::string("PipeTransport: write failed: ") + ::strerror(err));
        }
        off += static_cast<std::size_t>(n);
    }
}

std::optional<DecodeResult> PipeTransport::Receive() {
    FUNC_SCOPE();
    auto& framer = pImpl->framer;
    std::array<char, 8192> tmp{};
    while (true) {
        if (pImpl->closing) {
            return std::nullopt;
        }
        auto r = framer.next();
        if (r.status == LineFramer::DecodeStatus::Ok) {
            LOG_DEBUG("PipeTransport[{}] recv: {}", pImpl->sessionId, r.payload.value());
            return Envelope::Decode(r.payload.value());
        }
        if (r.status == LineFramer::DecodeStatus::LineTooLong) {
            DecodeResult tooLong;
            tooLong.error = errors::makeError(JSONRPCErrorCodes::ParseError, "Frame exceeds maximum line length");
            return tooLong;
        }
        if (pImpl->eof) {
            return std::nullopt;
        }

        std::array<pollfd, 2> pfds{};
        pfds[0].fd = pImpl->readFd;
        pfds[0].events = POLLIN;
        pfds[1].fd = pImpl->wakeEventFd;
        pfds[1].events = POLLIN;
        int rc = ::poll(pfds.data(), pImpl->wakeEventFd >= 0 ? 2 : 1, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("PipeTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
            pImpl->eof = true;
            pImpl->peerClosed = true;
            continue;
        }
        if (pfds[1].revents & POLLIN) {
            return std::nullopt;
        }
        if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::read(pImpl->readFd, tmp.data(), tmp.size());
            if (n > 0) {
                framer.append(tmp.data(), static_cast<std::size_t>(n));
            } else if (n == 0) {
                LOG_INFO("PipeTransport: {} closed its stdout", pImpl->sessionId);
                pImpl->eof = true;
                pImpl->peerClosed = true;
                auto rest = framer.takeRemainder();
                if (rest.has_value()) {
                    return Envelope::Decode(rest.value());
                }
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_ERROR("PipeTransport: read failed (errno={} msg={})", errno, ::strerror(errno));
                pImpl->eof = true;
                pImpl->peerClosed = true;
            }
        }
    }
}

} // namespace mcphub
