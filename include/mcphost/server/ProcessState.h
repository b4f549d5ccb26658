//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessState.h
// Purpose: Lifecycle state of a launched server process and the transitions allowed between states
//==========================================================================================================

#pragma once

namespace mcphost {

//==========================================================================================================
// ProcessState
//   NotStarted -> Starting -> Ready -> Live -> Stopping -> Exited
// Starting and Ready may also end in Failed (launch or health check failure), Exited (the child died
// first) or Stopping (an explicit stop during launch). Exited and Failed are terminal.
//==========================================================================================================
enum class ProcessState {
    NotStarted,
    Starting,
    Ready,
    Live,
    Stopping,
    Exited,
    Failed
};

const char* ToString(ProcessState state);

bool IsValidTransition(ProcessState from, ProcessState to);

inline bool IsTerminal(ProcessState state) {
    return state == ProcessState::Exited || state == ProcessState::Failed;
}

} // namespace mcphost
