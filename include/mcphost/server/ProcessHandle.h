//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessHandle.h
// Purpose: Owned reference to a spawned tool server process and its stdio pipes
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "mcphost/server/ServerConfig.h"

namespace mcphost {

//==========================================================================================================
// ExitStatus
// Purpose: How a child terminated. Exactly one of code/signal is set once the child has been reaped.
//==========================================================================================================
struct ExitStatus {
    std::optional<int> code;
    std::optional<int> signal;
};

// "SIGTERM", "SIGKILL", ... or "null" when no signal is set.
std::string SignalName(std::optional<int> signal);

//==========================================================================================================
// ProcessHandle
// Purpose: OS process reference shared between the launcher (owner), discovery and the transport.
// Notes:
//   - The parent ends of the stdin/stdout/stderr pipes are closed when the last reference goes away.
//   - Exit information is written once by the launcher's exit watcher.
//==========================================================================================================
struct ProcessHandle {
    ProcessHandle(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    const pid_t pid;

    int StdinFd() const { return stdinFd_; }
    int StdoutFd() const { return stdoutFd_; }
    int StderrFd() const { return stderrFd_; }

    bool Killed() const { return killed_.load(); }
    void MarkKilled() { killed_.store(true); }

    bool HasExited() const;
    std::optional<ExitStatus> GetExitStatus() const;
    void SetExitStatus(const ExitStatus& status);

private:
    int stdinFd_;
    int stdoutFd_;
    int stderrFd_;
    std::atomic<bool> killed_{false};
    mutable std::mutex mutex_;
    std::optional<ExitStatus> exit_;
};

//==========================================================================================================
// SpawnProcess
// Purpose: Starts config.command with config.args, stdio connected to fresh pipes.
// Args:
//   config: Command, arguments and environment overrides (merged over the current environment).
// Returns:
//   Handle for the running child. Throws std::system_error when the process cannot be created,
//   including a missing executable.
//==========================================================================================================
std::shared_ptr<ProcessHandle> SpawnProcess(const ServerConfig& config);

// Non-blocking reap. Returns the exit status when the child has terminated, nullopt while it runs.
// Throws std::system_error if waitpid fails for a reason other than the child being gone.
std::optional<ExitStatus> TryReap(pid_t pid);

} // namespace mcphost
