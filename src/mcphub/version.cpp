//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers
//==========================================================================================================
#include "mcphub/version.h"

#include <fmt/format.h>

namespace mcphub {

VersionInfo getVersion() {
    return VersionInfo{1, 0, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

Implementation makeImplementation(const std::string& name) {
    return Implementation{name, getVersionString()};
}

} // namespace mcphub
