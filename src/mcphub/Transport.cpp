//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Default transport factory
//==========================================================================================================

#include <stdexcept>

#include "mcphub/Transport.h"
#include "mcphub/Config.h"
#include "mcphub/PipeTransport.hpp"
#include "mcphub/WebSocketTransport.hpp"
#include "logging/Logger.h"

namespace mcphub {

std::unique_ptr<ITransport> TransportFactory::CreateTransport(const std::string& config) {
    return CreateTransport(ParseServerConfig(config));
}

std::unique_ptr<ITransport> TransportFactory::CreateTransport(const ServerConfig& config) {
    FUNC_SCOPE();
    switch (config.transport) {
        case TransportKind::Pipe: {
            PipeTransport::Options opts;
            opts.command = config.command;
            opts.args = config.args;
            opts.env = config.env;
            opts.cwd = config.cwd;
            LOG_DEBUG("TransportFactory: pipe transport for '{}'", config.command);
            return std::make_unique<PipeTransport>(opts);
        }
        case TransportKind::WebSocket: {
            WebSocketTransport::Options opts;
            opts.url = config.url;
            opts.caFile = config.caFile;
            opts.verifyPeer = config.verifyPeer;
            opts.connectTimeout = config.handshakeTimeout;
            LOG_DEBUG("TransportFactory: websocket transport for {}", config.url);
            return std::make_unique<WebSocketTransport>(opts);
        }
    }
    throw std::invalid_argument("TransportFactory: unsupported transport kind");
}

} // namespace mcphub
