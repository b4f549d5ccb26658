//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and to build child process environments.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>

extern char** environ;

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
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
// GetEnvUint64OrDefault
// Purpose: Reads an unsigned integer override (milliseconds, counts). Malformed values fall back to the
//          default so a typo in the environment never aborts a launch.
//==========================================================================================================
inline uint64_t GetEnvUint64OrDefault(const char* name, uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(raw, &used);
        if (used != raw.size()) {
            return defaultValue;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

//==========================================================================================================
// CurrentEnvironment
// Purpose: Snapshot of the calling process environment as a name -> value map.
//==========================================================================================================
inline std::map<std::string, std::string> CurrentEnvironment() {
    std::map<std::string, std::string> out;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        out[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return out;
}

//==========================================================================================================
// MergeEnvironment
// Purpose: Overlays the given variables on the current process environment. Overrides win.
//==========================================================================================================
inline std::map<std::string, std::string> MergeEnvironment(const std::map<std::string, std::string>& overrides) {
    auto merged = CurrentEnvironment();
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    return merged;
}
