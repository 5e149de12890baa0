//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CorrelationTable.h
// Purpose: Thread-safe map from request id to a single-assignment response slot
//==========================================================================================================

#pragma once

#include <cstdint>
#include <future>
#include <mutex>
#include <unordered_map>

#include "mcphub/Envelope.h"

namespace mcphub {

//==========================================================================================================
// CorrelationTable
// Purpose: Matches responses arriving on a connection's reader thread with the callers awaiting them.
// Notes:
//   - Ids are a per-table monotonic counter starting at 1; never reused.
//   - Every slot is fulfilled at most once, and always with an Envelope (a synthesized error response
//     on cancellation), so the reader never throws into a caller.
//   - After CancelAll() the table is closed: Register() returns a slot that is already failed.
//==========================================================================================================
class CorrelationTable {
public:
    struct PendingCall {
        int64_t id;
        std::future<Envelope> result;
    };

    CorrelationTable() = default;
    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    // Allocates a fresh id and an empty slot.
    PendingCall Register();

    //==========================================================================================================
    // Fulfills and removes the slot for id.
    // Args:
    //   id:       Correlation id taken from a response.
    //   response: The response envelope.
    // Returns:
    //   true if a pending slot existed; false for unknown or stale ids (never throws).
    //==========================================================================================================
    bool Resolve(int64_t id, Envelope response);

    // Removes the slot without fulfilling it (caller gave up waiting). Returns false if already resolved.
    bool Cancel(int64_t id);

    //==========================================================================================================
    // Fails every outstanding slot with an error response carrying reason, and closes the table.
    // Returns:
    //   Number of slots failed.
    //==========================================================================================================
    std::size_t CancelAll(const errors::McpError& reason);

    std::size_t Size() const;
    bool IsClosed() const;

private:
    mutable std::mutex mutex;
    int64_t nextId{1};
    bool closed{false};
    errors::McpError closeReason;
    std::unordered_map<int64_t, std::promise<Envelope>> pending;
};

} // namespace mcphub
