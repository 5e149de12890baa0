//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read MCPHUB_* environment variables with typed defaults.
//==========================================================================================================
#pragma once
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvMillisOrDefault
// Purpose: Reads a non-negative millisecond count from the environment.
// Args:
//   name: Environment variable name (e.g. "MCPHUB_REQUEST_TIMEOUT_MS").
//   defaultValue: Returned when the variable is unset or not a valid non-negative integer.
// Returns:
//   Parsed duration or defaultValue.
//==========================================================================================================
inline std::chrono::milliseconds GetEnvMillisOrDefault(const char* name, std::chrono::milliseconds defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        long long v = std::stoll(raw, &used);
        if (used != raw.size() || v < 0) {
            return defaultValue;
        }
        return std::chrono::milliseconds(v);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

//==========================================================================================================
// IsEnvFlagSet
// Purpose: True when the variable holds "1", "true" or "TRUE"; otherwise the given default.
//==========================================================================================================
inline bool IsEnvFlagSet(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, defaultValue ? "1" : "0");
    return (v == "1" || v == "true" || v == "TRUE");
}
