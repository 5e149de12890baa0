//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based server transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>

#include <array>
#include <atomic>
#include <cstring>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "mcphub/LineFramer.h"
#include "mcphub/StdioTransport.hpp"

namespace mcphub {

class StdioTransport::Impl {
public:
    int inFd;
    int outFd;
    int wakeEventFd{-1};
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> outputBroken{false};
    std::mutex writeMutex;
    LineFramer framer;
    bool eof{false};
    std::string sessionId;

    Impl(int in, int out) : inFd(in), outFd(out) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
        }
    }
};

StdioTransport::StdioTransport() : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {}

StdioTransport::StdioTransport(int inFd, int outFd) : pImpl(std::make_unique<Impl>(inFd, outFd)) {}

StdioTransport::~StdioTransport() {
    (void)Close();
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    // A vanished client must surface as EPIPE on write
    ::signal(SIGPIPE, SIG_IGN);
    int flags = ::fcntl(pImpl->inFd, F_GETFL, 0);
    if (flags >= 0) { (void)::fcntl(pImpl->inFd, F_SETFL, flags | O_NONBLOCK); }
    pImpl->connected = true;
    LOG_INFO("StdioTransport: started ({})", pImpl->sessionId);
    std::promise<void> ready; ready.set_value(); return ready.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    if (!pImpl->closing.exchange(true)) {
        pImpl->connected = false;
        if (pImpl->wakeEventFd >= 0) {
            uint64_t one = 1;
            ssize_t w = ::write(pImpl->wakeEventFd, &one, sizeof(one));
            if (w < 0 && errno != EAGAIN) {
                LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            }
        }
        LOG_INFO("StdioTransport: closed ({})", pImpl->sessionId);
    }
    std::promise<void> done; done.set_value(); return done.get_future();
}

bool StdioTransport::IsConnected() const {
    return pImpl->connected && !pImpl->outputBroken;
}

std::string StdioTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void StdioTransport::Send(const Envelope& envelope) {
    FUNC_SCOPE();
    std::string frame = LineFramer::encode(envelope.Encode());
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    if (pImpl->closing || pImpl->outputBroken) {
        throw errors::McpException(JSONRPCErrorCodes::TransportClosed, "StdioTransport: transport closed");
    }
    std::size_t off = 0;
    while (off < frame.size()) {
        ssize_t n = ::write(pImpl->outFd, frame.data() + off, frame.size() - off);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd p{pImpl->outFd, POLLOUT, 0};
                (void)::poll(&p, 1, 100);
                continue;
            }
            int err = errno;
            pImpl->outputBroken = true;
            throw errors::McpException(JSONRPCErrorCodes::TransportClosed,
                                       std::string("StdioTransport: write failed: ") + ::strerror(err));
        }
        off += static_cast<std::size_t>(n);
    }
}

std::optional<DecodeResult> StdioTransport::Receive() {
    FUNC_SCOPE();
    auto& framer = pImpl->framer;
    std::array<char, 8192> tmp{};
    while (true) {
        if (pImpl->closing) {
            return std::nullopt;
        }
        auto r = framer.next();
        if (r.status == LineFramer::DecodeStatus::Ok) {
            LOG_DEBUG("StdioTransport recv: {}", r.payload.value());
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
        pfds[0].fd = pImpl->inFd;
        pfds[0].events = POLLIN;
        pfds[1].fd = pImpl->wakeEventFd;
        pfds[1].events = POLLIN;
        int rc = ::poll(pfds.data(), pImpl->wakeEventFd >= 0 ? 2 : 1, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
            pImpl->eof = true;
            continue;
        }
        if (pfds[1].revents & POLLIN) {
            return std::nullopt;
        }
        if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = ::read(pImpl->inFd, tmp.data(), tmp.size());
            if (n > 0) {
                framer.append(tmp.data(), static_cast<std::size_t>(n));
            } else if (n == 0) {
                LOG_INFO("StdioTransport: stdin closed");
                pImpl->eof = true;
                auto rest = framer.takeRemainder();
                if (rest.has_value()) {
                    return Envelope::Decode(rest.value());
                }
            } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_ERROR("StdioTransport: read failed (errno={} msg={})", errno, ::strerror(errno));
                pImpl->eof = true;
            }
        }
    }
}

} // namespace mcphub
