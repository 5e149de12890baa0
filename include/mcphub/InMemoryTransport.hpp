//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "mcphub/Transport.h"
#include <memory>
#include <utility>

namespace mcphub {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport used for tests and embedding. Frames are encoded exactly as on the wire
//          and delivered to the paired transport's inbox, so both ends exercise the real codec.
// Notes:
//   Closing either end ends the peer's receive sequence once its inbox is drained.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const Envelope& envelope) override;
    std::optional<DecodeResult> Receive() override;

    //==========================================================================================================
    // SendRaw
    // Purpose: Delivers an arbitrary frame to the peer (used to inject malformed input in tests).
    //==========================================================================================================
    void SendRaw(const std::string& frame);

    //==========================================================================================================
    // SentCount
    // Purpose: Number of frames this end has delivered to its peer.
    //==========================================================================================================
    std::size_t SentCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphub
