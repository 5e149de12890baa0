//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "mcphub/InMemoryTransport.hpp"

namespace mcphub {

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::string sessionId;
    std::weak_ptr<Impl> peer;
    std::deque<std::string> inbox;
    bool peerClosed{false};
    mutable std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::atomic<std::size_t> sentCount{0};

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    void enqueueMessage(std::string message) {
        std::lock_guard<std::mutex> lock(queueMutex);
        inbox.push_back(std::move(message));
        queueCondition.notify_one();
    }

    void markPeerClosed() {
        std::lock_guard<std::mutex> lock(queueMutex);
        peerClosed = true;
        queueCondition.notify_all();
    }

    void sendToPeer(std::string frame) {
        if (closed.load()) {
            throw errors::McpException(JSONRPCErrorCodes::TransportClosed, "InMemoryTransport: transport closed");
        }
        auto p = peer.lock();
        if (!p || p->closed.load()) {
            throw errors::McpException(JSONRPCErrorCodes::TransportClosed, "InMemoryTransport: peer not connected");
        }
        LOG_DEBUG("InMemoryTransport[{}] send: {}", sessionId, frame);
        p->enqueueMessage(std::move(frame));
        ++sentCount;
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    (void)Close();
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    transport1->pImpl->peer = transport2->pImpl;
    transport2->pImpl->peer = transport1->pImpl;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = true;
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (!pImpl->closed.exchange(true)) {
        LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
        pImpl->connected = false;
        pImpl->markPeerClosed();
        if (auto p = pImpl->peer.lock()) {
            p->markPeerClosed();
        }
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected && !pImpl->closed; }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

void InMemoryTransport::Send(const Envelope& envelope) {
    FUNC_SCOPE();
    pImpl->sendToPeer(envelope.Encode());
}

void InMemoryTransport::SendRaw(const std::string& frame) {
    FUNC_SCOPE();
    pImpl->sendToPeer(frame);
}

std::size_t InMemoryTransport::SentCount() const {
    return pImpl->sentCount.load();
}

std::optional<DecodeResult> InMemoryTransport::Receive() {
    FUNC_SCOPE();
    std::string frame;
    {
        std::unique_lock<std::mutex> lock(pImpl->queueMutex);
        pImpl->queueCondition.wait(lock, [this]() {
            return !pImpl->inbox.empty() || pImpl->peerClosed || pImpl->closed.load();
        });
        // A locally closed end stops immediately; a peer close still drains what was already sent
        if (pImpl->closed.load() || pImpl->inbox.empty()) {
            return std::nullopt;
        }
        frame = std::move(pImpl->inbox.front());
        pImpl->inbox.pop_front();
    }
    return Envelope::Decode(frame);
}

} // namespace mcphub
