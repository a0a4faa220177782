//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Opt-in client-side validation of tool calls (Off by default)
//==========================================================================================================

#pragma once

#include <string>

namespace toolhost {
namespace validation {

// Off forwards every call as-is; Strict checks tool name and required arguments before writing.
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

// Utility to convert to/from string for docs/config friendliness
inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Off:
        default: return "Off";
    }
}

inline ValidationMode parseMode(const std::string& s) {
    if (s == "strict" || s == "Strict" || s == "STRICT") return ValidationMode::Strict;
    return ValidationMode::Off;
}

} // namespace validation
} // namespace toolhost
