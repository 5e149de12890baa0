//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: ServerConfig defaults and parsing of the semicolon-delimited key=value form
//==========================================================================================================

#include <stdexcept>

#include "mcphub/Config.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace mcphub {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

std::chrono::milliseconds parseMillis(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(val, &used);
        if (used == val.size() && v > 0) {
            return std::chrono::milliseconds(v);
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw std::invalid_argument("ServerConfig: " + key + " must be a positive integer, got '" + val + "'");
}

bool parseBool(const std::string& key, const std::string& val) {
    if (val == "true" || val == "1") {
        return true;
    }
    if (val == "false" || val == "0") {
        return false;
    }
    throw std::invalid_argument("ServerConfig: " + key + " must be true or false, got '" + val + "'");
}

} // namespace

ServerConfig::ServerConfig()
    : requestTimeout(GetEnvMillisOrDefault("MCPHUB_REQUEST_TIMEOUT_MS", std::chrono::milliseconds(30000))),
      handshakeTimeout(GetEnvMillisOrDefault("MCPHUB_HANDSHAKE_TIMEOUT_MS", std::chrono::milliseconds(10000))) {}

std::vector<std::string> SplitArgs(const std::string& text) {
    std::vector<std::string> out;
    std::string cur;
    bool inQuotes = false;
    bool have = false;
    for (char c : text) {
        if (c == '"') {
            inQuotes = !inQuotes;
            have = true;
        } else if ((c == ' ' || c == '\t') && !inQuotes) {
            if (have) {
                out.push_back(cur);
                cur.clear();
                have = false;
            }
        } else {
            cur.push_back(c);
            have = true;
        }
    }
    if (inQuotes) {
        throw std::invalid_argument("ServerConfig: unbalanced quote in args");
    }
    if (have) {
        out.push_back(cur);
    }
    return out;
}

ServerConfig ParseServerConfig(const std::string& text) {
    FUNC_SCOPE();
    ServerConfig cfg;
    bool transportSet = false;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t sep = text.find(';', start);
        if (sep == std::string::npos) { sep = text.size(); }
        std::string kv = trim(text.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("ServerConfig: expected key=value, got '" + kv + "'");
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));
        if (key == "name") {
            cfg.name = val;
        } else if (key == "transport") {
            if (val == "pipe" || val == "stdio") {
                cfg.transport = TransportKind::Pipe;
            } else if (val == "websocket" || val == "ws") {
                cfg.transport = TransportKind::WebSocket;
            } else {
                throw std::invalid_argument("ServerConfig: unknown transport '" + val + "'");
            }
            transportSet = true;
        } else if (key == "command") {
            cfg.command = val;
        } else if (key == "args") {
            cfg.args = SplitArgs(val);
        } else if (key == "env") {
            std::size_t p = 0;
            while (p < val.size()) {
                std::size_t comma = val.find(',', p);
                if (comma == std::string::npos) { comma = val.size(); }
                std::string pair = trim(val.substr(p, comma - p));
                p = comma + 1;
                if (pair.empty()) {
                    continue;
                }
                std::size_t peq = pair.find('=');
                if (peq == std::string::npos || peq == 0) {
                    throw std::invalid_argument("ServerConfig: env entry must be K=V, got '" + pair + "'");
                }
                cfg.env.emplace_back(pair.substr(0, peq), pair.substr(peq + 1));
            }
        } else if (key == "cwd") {
            cfg.cwd = val;
        } else if (key == "url") {
            cfg.url = val;
        } else if (key == "caFile") {
            cfg.caFile = val;
        } else if (key == "verifyPeer") {
            cfg.verifyPeer = parseBool(key, val);
        } else if (key == "timeoutMs") {
            cfg.requestTimeout = parseMillis(key, val);
        } else if (key == "handshakeTimeoutMs") {
            cfg.handshakeTimeout = parseMillis(key, val);
        } else {
            throw std::invalid_argument("ServerConfig: unknown key '" + key + "'");
        }
    }

    if (!transportSet && !cfg.url.empty()) {
        cfg.transport = TransportKind::WebSocket;
    }
    if (cfg.transport == TransportKind::Pipe && cfg.command.empty()) {
        throw std::invalid_argument("ServerConfig: pipe transport requires command");
    }
    if (cfg.transport == TransportKind::WebSocket && cfg.url.empty()) {
        throw std::invalid_argument("ServerConfig: websocket transport requires url");
    }
    return cfg;
}

} // namespace mcphub
