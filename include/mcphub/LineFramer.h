//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.h
// Purpose: Newline-delimited framing shared by the pipe and stdio transports
//========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace mcphub {

//========================================================================================================
// LineFramer
// Purpose: Splits a byte stream into frames terminated by '\n' (a preceding '\r' is stripped).
// Notes:
//   A line exceeding maxLineLength is discarded up to and including its terminator; the framer stays
//   in discard mode across reads until that terminator arrives. Empty lines are skipped.
//========================================================================================================
class LineFramer {
public:
    static constexpr std::size_t DefaultMaxLineLength = 4 * 1024 * 1024;

    enum class DecodeStatus {
        Ok,
        Incomplete,
        LineTooLong
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
    };

    explicit LineFramer(std::size_t maxLineLength = DefaultMaxLineLength) : maxLineLength(maxLineLength) {}

    static std::string encode(const std::string& payload) {
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    // Appends freshly read bytes to the internal buffer.
    void append(const char* data, std::size_t len);

    // Extracts the next complete frame, if any.
    DecodeResult next();

    // Remaining bytes of an unterminated final line (flushed when the stream hits EOF).
    std::optional<std::string> takeRemainder();

private:
    std::size_t maxLineLength;
    std::string buffer;
    bool discarding{false};
};

} // namespace mcphub
