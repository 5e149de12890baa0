//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeTransport.hpp
// Purpose: Client-side transport that spawns a server child process and speaks over its stdin/stdout
//==========================================================================================================
#pragma once

#include "mcphub/Transport.h"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mcphub {

//==========================================================================================================
// PipeTransport
// Purpose: Spawns `command args...` with pipes on stdin/stdout; one encoded envelope per line in each
//          direction. The child's stderr is inherited so server diagnostics reach the parent's stderr.
// Notes:
//   - Start() fails with ConnectFailed when the executable cannot be launched.
//   - When the child exits or closes stdout, Receive() drains buffered lines and then ends; Send() after
//     that throws TransportClosed.
//   - Close() closes the child's stdin, waits terminateGrace for a clean exit, then SIGTERM, then SIGKILL,
//     and always reaps the child.
//==========================================================================================================
class PipeTransport : public ITransport {
public:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::vector<std::pair<std::string, std::string>> env;
        std::string cwd;
        std::chrono::milliseconds terminateGrace{500};
        std::size_t maxLineLength{4 * 1024 * 1024};
    };

    explicit PipeTransport(const Options& opts);
    ~PipeTransport() override;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const Envelope& envelope) override;
    std::optional<DecodeResult> Receive() override;

    // Child process id (-1 before Start or after a failed Start).
    int GetChildPid() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphub
