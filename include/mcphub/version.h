//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version, reported as clientInfo/serverInfo.version by the example programs
//==========================================================================================================
#pragma once

#include <string>

#include "mcphub/Protocol.h"

namespace mcphub {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// Implementation record {name, getVersionString()} for handshakes.
Implementation makeImplementation(const std::string& name);

} // namespace mcphub
