//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessState.cpp
// Purpose: Process lifecycle transition table
//==========================================================================================================

#include "mcphost/server/ProcessState.h"

namespace mcphost {

const char* ToString(ProcessState state) {
    switch (state) {
        case ProcessState::NotStarted: return "NotStarted";
        case ProcessState::Starting: return "Starting";
        case ProcessState::Ready: return "Ready";
        case ProcessState::Live: return "Live";
        case ProcessState::Stopping: return "Stopping";
        case ProcessState::Exited: return "Exited";
        case ProcessState::Failed: return "Failed";
    }
    return "Unknown";
}

bool IsValidTransition(ProcessState from, ProcessState to) {
    switch (from) {
        case ProcessState::NotStarted:
            return to == ProcessState::Starting;
        case ProcessState::Starting:
            return to == ProcessState::Ready || to == ProcessState::Failed ||
                   to == ProcessState::Exited || to == ProcessState::Stopping;
        case ProcessState::Ready:
            return to == ProcessState::Live || to == ProcessState::Failed ||
                   to == ProcessState::Exited || to == ProcessState::Stopping;
        case ProcessState::Live:
            return to == ProcessState::Stopping || to == ProcessState::Exited;
        case ProcessState::Stopping:
            return to == ProcessState::Exited;
        case ProcessState::Exited:
        case ProcessState::Failed:
            return false;
    }
    return false;
}

} // namespace mcphost
