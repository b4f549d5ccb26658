//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerLauncher.h
// Purpose: Spawns and supervises one tool server process per server name
//==========================================================================================================

#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mcphost/server/ProcessHandle.h"
#include "mcphost/server/ProcessState.h"
#include "mcphost/server/ServerConfig.h"
#include "mcphost/server/ServerErrors.h"

namespace mcphost {

// Outcome of one liveness probe.
enum class ProbeResult {
    Alive,
    NotAlive,
    Error
};

// Decides readiness from the server's diagnostic (stderr) output seen so far. The text passed in keeps
// a tail of the previous reads so a marker split across reads is still visible.
using ReadinessPredicate = std::function<bool(std::string_view diagnosticOutput)>;
using LivenessProbe = std::function<ProbeResult(pid_t pid)>;
// Same contract as ::kill: 0 on success, -1 with errno set on failure.
using SignalSender = std::function<int(pid_t pid, int signal)>;

// Ready when any marker occurs in the output. An empty marker list means ready as soon as spawned.
ReadinessPredicate MakeMarkerPredicate(std::vector<std::string> markers);

// kill(pid, 0): success is Alive, ESRCH is NotAlive, anything else is Error.
ProbeResult DefaultLivenessProbe(pid_t pid);

//==========================================================================================================
// LauncherOptions
// Purpose: Timeouts and the swappable readiness/liveness/signal seams of a ServerLauncher.
// Fields:
//   launchTimeout:  Bound on the wait for a readiness marker.
//   healthTimeout:  Bound on the whole health check.
//   healthRetries:  Probe attempts before giving up (at least one attempt is made).
//   healthInterval: Delay between probe attempts.
//   stopTimeout:    Grace period between SIGTERM and SIGKILL.
//   readiness:      Overrides readinessMarkers when set.
//==========================================================================================================
struct LauncherOptions {
    std::chrono::milliseconds launchTimeout{15000};
    std::chrono::milliseconds healthTimeout{10000};
    unsigned int healthRetries{3};
    std::chrono::milliseconds healthInterval{2000};
    std::chrono::milliseconds stopTimeout{5000};
    std::vector<std::string> readinessMarkers{"running on stdio", "Allowed directories:"};
    ReadinessPredicate readiness;
    LivenessProbe livenessProbe;
    SignalSender signalSender;

    // Defaults overridden by MCPHOST_LAUNCH_TIMEOUT_MS, MCPHOST_HEALTH_TIMEOUT_MS, MCPHOST_HEALTH_RETRIES,
    // MCPHOST_HEALTH_INTERVAL_MS and MCPHOST_STOP_TIMEOUT_MS.
    static LauncherOptions FromEnvironment();
};

//==========================================================================================================
// IServerLauncher
// Purpose: Process lifecycle for named tool servers. At most one process is tracked per name.
//==========================================================================================================
class IServerLauncher {
public:
    virtual ~IServerLauncher() = default;

    //==========================================================================================================
    // Launch
    // Purpose: Spawns the server, waits for its readiness marker and health-checks it.
    // Args:
    //   name: Server name; must not be tracked already.
    //   config: Command line and environment overrides.
    // Returns:
    //   Future resolving to the live process. Fails with LaunchError, HealthError or ExitError; a failed
    //   launch leaves nothing running or tracked under the name.
    // Notes:
    //   The name is reserved at once, so a second Launch fails with "Server is already running" even
    //   before the first has spawned. GetProcess reports the process only once it is spawned.
    //==========================================================================================================
    virtual std::future<std::shared_ptr<ProcessHandle>> Launch(const std::string& name, const ServerConfig& config) = 0;

    //==========================================================================================================
    // Stop
    // Purpose: SIGTERM, then SIGKILL when the process has not exited within the stop timeout.
    // Returns:
    //   Future completing once the process is gone and untracked. Completes immediately for unknown
    //   names; never fails.
    //==========================================================================================================
    virtual std::future<void> Stop(const std::string& name) = 0;

    // Stops every tracked server concurrently.
    virtual std::future<void> StopAll() = 0;

    // Tracked process for the name, or nullptr.
    virtual std::shared_ptr<ProcessHandle> GetProcess(const std::string& name) const = 0;

    virtual std::vector<std::string> GetServerNames() const = 0;

    // Untracks the name immediately and terminates the process in the background. Failures are logged.
    // A Launch of the same name issued meanwhile spawns only once that process has exited, or after
    // twice the stop timeout when it cannot be reaped.
    virtual void Cleanup(const std::string& name) = 0;

    // Reports unexpected exits with a non-zero code or a signal, after the server went live.
    using ErrorHandler = std::function<void(const ServerError& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Reports every unexpected exit of a live server; the name is already untracked when this runs.
    using ExitHandler = std::function<void(const std::string& name, std::optional<int> code, std::optional<int> signal)>;
    virtual void SetExitHandler(ExitHandler handler) = 0;
};

//==========================================================================================================
// ServerLauncher
// Purpose: IServerLauncher driven by a boost::asio io_context on a dedicated thread. Readiness, health
//          probing, exit observation (pidfd) and graceful stop are coroutines on that context.
// Notes:
//   Destruction stops every tracked server and kills anything still terminating in the background.
//==========================================================================================================
class ServerLauncher : public IServerLauncher {
public:
    ServerLauncher();
    explicit ServerLauncher(LauncherOptions options);
    ~ServerLauncher() override;

    ServerLauncher(const ServerLauncher&) = delete;
    ServerLauncher& operator=(const ServerLauncher&) = delete;

    std::future<std::shared_ptr<ProcessHandle>> Launch(const std::string& name, const ServerConfig& config) override;
    std::future<void> Stop(const std::string& name) override;
    std::future<void> StopAll() override;
    std::shared_ptr<ProcessHandle> GetProcess(const std::string& name) const override;
    std::vector<std::string> GetServerNames() const override;
    void Cleanup(const std::string& name) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetExitHandler(ExitHandler handler) override;

    // Lifecycle state of a tracked server, nullopt when the name is not tracked.
    std::optional<ProcessState> GetState(const std::string& name) const;

    const LauncherOptions& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
