//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the toolhost library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace toolhost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

// Returns the library semantic version components.
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string, reported to tool servers as clientInfo.version.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

} // namespace toolhost
