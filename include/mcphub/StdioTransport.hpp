//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Server-side transport over the process's own stdin/stdout (newline-delimited envelopes)
//==========================================================================================================
#pragma once

#include "mcphub/Transport.h"

#include <memory>

namespace mcphub {

//==========================================================================================================
// StdioTransport
// Purpose: Counterpart of PipeTransport running inside the spawned server. Reads one envelope per line
//          from stdin and writes one per line to stdout.
// Notes:
//   Anything else written to stdout corrupts the stream; run with MCPHUB_STDIO_MODE=1 so the Logger
//   writes to stderr.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport();
    // Uses the given descriptors instead of stdin/stdout (the transport does not own them).
    StdioTransport(int inFd, int outFd);
    ~StdioTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const Envelope& envelope) override;
    std::optional<DecodeResult> Receive() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphub
