//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Newline-delimited framer implementation
//========================================================================================================

#include "logging/Logger.h"
#include "mcphub/LineFramer.h"

namespace mcphub {

void LineFramer::append(const char* data, std::size_t len) {
    buffer.append(data, len);
}

LineFramer::DecodeResult LineFramer::next() {
    while (true) {
        std::size_t eol = buffer.find('\n');
        if (discarding) {
            if (eol == std::string::npos) {
                buffer.clear();
                return { DecodeStatus::Incomplete, std::nullopt };
            }
            buffer.erase(0, eol + 1);
            discarding = false;
            continue;
        }
        if (eol == std::string::npos) {
            if (buffer.size() > maxLineLength) {
                LOG_WARN("LineFramer: line exceeds {} bytes; discarding", maxLineLength);
                buffer.clear();
                discarding = true;
                return { DecodeStatus::LineTooLong, std::nullopt };
            }
            return { DecodeStatus::Incomplete, std::nullopt };
        }
        std::size_t len = eol;
        if (len > 0 && buffer[len - 1] == '\r') {
            --len;
        }
        if (len > maxLineLength) {
            LOG_WARN("LineFramer: line of {} bytes exceeds {}; dropped", len, maxLineLength);
            buffer.erase(0, eol + 1);
            return { DecodeStatus::LineTooLong, std::nullopt };
        }
        std::string line = buffer.substr(0, len);
        buffer.erase(0, eol + 1);
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        return { DecodeStatus::Ok, std::make_optional(std::move(line)) };
    }
}

std::optional<std::string> LineFramer::takeRemainder() {
    if (discarding || buffer.find_first_not_of(" \t\r") == std::string::npos) {
        buffer.clear();
        discarding = false;
        return std::nullopt;
    }
    std::string rest = std::move(buffer);
    buffer.clear();
    return rest;
}

} // namespace mcphub
