//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CorrelationTable.cpp
// Purpose: Request/response correlation
//==========================================================================================================

#include "mcphub/CorrelationTable.h"
#include "logging/Logger.h"

namespace mcphub {

CorrelationTable::PendingCall CorrelationTable::Register() {
    std::promise<Envelope> slot;
    std::lock_guard<std::mutex> lk(mutex);
    int64_t id = nextId++;
    PendingCall call{id, slot.get_future()};
    if (closed) {
        slot.set_value(Envelope::MakeError(JSONRPCId{id}, closeReason));
        return call;
    }
    pending.emplace(id, std::move(slot));
    return call;
}

bool CorrelationTable::Resolve(int64_t id, Envelope response) {
    std::promise<Envelope> slot;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = pending.find(id);
        if (it == pending.end()) {
            return false;
        }
        slot = std::move(it->second);
        pending.erase(it);
    }
    slot.set_value(std::move(response));
    return true;
}

bool CorrelationTable::Cancel(int64_t id) {
    std::lock_guard<std::mutex> lk(mutex);
    return pending.erase(id) > 0;
}

std::size_t CorrelationTable::CancelAll(const errors::McpError& reason) {
    std::unordered_map<int64_t, std::promise<Envelope>> drained;
    {
        std::lock_guard<std::mutex> lk(mutex);
        closed = true;
        closeReason = reason;
        drained.swap(pending);
    }
    for (auto& [id, slot] : drained) {
        slot.set_value(Envelope::MakeError(JSONRPCId{id}, reason));
    }
    if (!drained.empty()) {
        LOG_DEBUG("CorrelationTable: failed {} pending call(s): {}", drained.size(), reason.message);
    }
    return drained.size();
}

std::size_t CorrelationTable::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return pending.size();
}

bool CorrelationTable::IsClosed() const {
    std::lock_guard<std::mutex> lk(mutex);
    return closed;
}

} // namespace mcphub
