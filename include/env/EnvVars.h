//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and expand ${VAR} references safely.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdint>
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
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvMillisOrDefault
// Purpose: Reads a non-negative integer millisecond value; malformed values fall back to the default.
//==========================================================================================================
inline uint64_t GetEnvMillisOrDefault(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        return static_cast<uint64_t>(std::stoull(v));
    } catch (const std::exception&) {
        return defaultValue;
    }
}

//==========================================================================================================
// ExpandEnvReferences
// Purpose: Substitutes $VAR and ${VAR} references with values from the current environment.
// Notes:
//   References to unset variables are left untouched, matching shell "expandvars" behavior.
//   A '$' not followed by a name character (or an unterminated "${") is copied verbatim.
// Args:
//   value: Input string possibly containing references.
// Returns:
//   Expanded string.
//==========================================================================================================
inline std::string ExpandEnvReferences(const std::string& value) {
    auto isNameChar = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };
    std::string out;
    out.reserve(value.size());
    std::size_t i = 0;
    while (i < value.size()) {
        char c = value[i];
        if (c != '$' || i + 1 >= value.size()) {
            out.push_back(c);
            ++i;
            continue;
        }
        if (value[i + 1] == '{') {
            std::size_t close = value.find('}', i + 2);
            if (close == std::string::npos) {
                out.append(value, i, std::string::npos);
                break;
            }
            std::string name = value.substr(i + 2, close - (i + 2));
            const char* env = name.empty() ? nullptr : std::getenv(name.c_str());
            if (env) {
                out.append(env);
            } else {
                out.append(value, i, close - i + 1);
            }
            i = close + 1;
            continue;
        }
        std::size_t end = i + 1;
        while (end < value.size() && isNameChar(value[end])) {
            ++end;
        }
        if (end == i + 1) {
            out.push_back(c);
            ++i;
            continue;
        }
        std::string name = value.substr(i + 1, end - (i + 1));
        const char* env = std::getenv(name.c_str());
        if (env) {
            out.append(env);
        } else {
            out.append(value, i, end - i);
        }
        i = end;
    }
    return out;
}
