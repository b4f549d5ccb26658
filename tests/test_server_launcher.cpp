//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_launcher.cpp
// Purpose: ServerLauncher lifecycle tests with small shell servers
//==========================================================================================================

#include <gtest/gtest.h>

#include <signal.h>
#include <stdlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "mcphost/server/ServerLauncher.h"

using namespace mcphost;
using namespace std::chrono_literals;

namespace {

// Prints the readiness marker on stderr, then idles.
ServerConfig readyServer() {
    return ServerConfig{"/bin/sh", {"-c", "echo 'Test server running on stdio' 1>&2; exec sleep 30"}, std::nullopt};
}

LauncherOptions fastOptions() {
    LauncherOptions o;
    o.launchTimeout = 3000ms;
    o.healthTimeout = 2000ms;
    o.healthRetries = 3;
    o.healthInterval = 20ms;
    o.stopTimeout = 1000ms;
    return o;
}

// Forwards to ::kill and remembers what was sent.
struct SignalLog {
    std::mutex mu;
    std::vector<std::pair<pid_t, int>> sent;

    SignalSender sender() {
        return [this](pid_t pid, int sig) {
            {
                std::lock_guard<std::mutex> lk(mu);
                sent.emplace_back(pid, sig);
            }
            return ::kill(pid, sig);
        };
    }

    bool contains(pid_t pid, int sig) {
        std::lock_guard<std::mutex> lk(mu);
        return std::find(sent.begin(), sent.end(), std::make_pair(pid, sig)) != sent.end();
    }
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

template <typename E>
std::string launchFailure(ServerLauncher& launcher, const std::string& name, const ServerConfig& config) {
    try {
        launcher.Launch(name, config).get();
    } catch (const E& e) {
        return e.what();
    }
    ADD_FAILURE() << "launch of " << name << " did not fail as expected";
    return {};
}

} // namespace

TEST(ServerLauncher, LaunchWaitsForMarkerAndGoesLive) {
    ServerLauncher launcher(fastOptions());
    auto process = launcher.Launch("fs", readyServer()).get();
    ASSERT_NE(process, nullptr);
    EXPECT_GT(process->pid, 0);
    EXPECT_EQ(launcher.GetProcess("fs"), process);
    EXPECT_EQ(launcher.GetState("fs"), ProcessState::Live);
    EXPECT_EQ(launcher.GetServerNames(), std::vector<std::string>{"fs"});
}

TEST(ServerLauncher, StopTerminatesAndUntracks) {
    ServerLauncher launcher(fastOptions());
    auto process = launcher.Launch("fs", readyServer()).get();
    launcher.Stop("fs").get();
    EXPECT_EQ(launcher.GetProcess("fs"), nullptr);
    ASSERT_TRUE(process->HasExited());
    EXPECT_EQ(process->GetExitStatus()->signal, SIGTERM);
    EXPECT_TRUE(process->Killed());
}

TEST(ServerLauncher, StopUnknownNameCompletes) {
    ServerLauncher launcher(fastOptions());
    auto fut = launcher.Stop("nobody");
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_NO_THROW(fut.get());
}

TEST(ServerLauncher, DuplicateLaunchIsRejected) {
    ServerLauncher launcher(fastOptions());
    auto first = launcher.Launch("dup", readyServer()).get();
    EXPECT_EQ(launchFailure<LaunchError>(launcher, "dup", readyServer()),
              "Failed to launch server dup: Server is already running");
    EXPECT_EQ(launcher.GetProcess("dup"), first);
}

TEST(ServerLauncher, ConcurrentDuplicateLaunchSpawnsOnce) {
    ServerLauncher launcher(fastOptions());
    auto a = launcher.Launch("race", readyServer());
    auto b = launcher.Launch("race", readyServer());
    EXPECT_NO_THROW(a.get());
    EXPECT_THROW(b.get(), LaunchError);
    EXPECT_EQ(launcher.GetServerNames().size(), 1u);
}

TEST(ServerLauncher, StartupTimeoutLeavesNothingBehind) {
    auto options = fastOptions();
    options.launchTimeout = 300ms;
    ServerLauncher launcher(options);
    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(launchFailure<LaunchError>(launcher, "quiet", ServerConfig{"sleep", {"30"}, std::nullopt}),
              "Failed to launch server quiet: Server startup timeout reached");
    EXPECT_GE(std::chrono::steady_clock::now() - started, 300ms);
    EXPECT_EQ(launcher.GetProcess("quiet"), nullptr);
    EXPECT_TRUE(launcher.GetServerNames().empty());
}

TEST(ServerLauncher, ExitDuringStartupIsExitError) {
    ServerLauncher launcher(fastOptions());
    try {
        launcher.Launch("crash", ServerConfig{"/bin/sh", {"-c", "exit 4"}, std::nullopt}).get();
        FAIL() << "expected ExitError";
    } catch (const ExitError& e) {
        EXPECT_EQ(e.exitCode(), 4);
        EXPECT_EQ(e.serverName(), "crash");
        EXPECT_STREQ(e.what(), "Server crash exited with code 4 (signal: null)");
    }
    EXPECT_EQ(launcher.GetProcess("crash"), nullptr);
}

TEST(ServerLauncher, MissingExecutableIsLaunchError) {
    ServerLauncher launcher(fastOptions());
    auto message = launchFailure<LaunchError>(launcher, "ghost",
                                              ServerConfig{"mcphost-definitely-missing-binary", {}, std::nullopt});
    EXPECT_NE(message.find("Failed to get process ID"), std::string::npos);
    EXPECT_EQ(launcher.GetProcess("ghost"), nullptr);
}

TEST(ServerLauncher, MarkerSplitAcrossWritesIsDetected) {
    ServerLauncher launcher(fastOptions());
    ServerConfig config{"/bin/sh",
                        {"-c", "printf 'Server running on ' 1>&2; sleep 0.2; printf 'stdio\\n' 1>&2; exec sleep 30"},
                        std::nullopt};
    EXPECT_NO_THROW(launcher.Launch("split", config).get());
    EXPECT_EQ(launcher.GetState("split"), ProcessState::Live);
}

TEST(ServerLauncher, AlternativeMarkerIsAccepted) {
    ServerLauncher launcher(fastOptions());
    ServerConfig config{"/bin/sh", {"-c", "echo 'Allowed directories: [/tmp]' 1>&2; exec sleep 30"}, std::nullopt};
    EXPECT_NO_THROW(launcher.Launch("fs", config).get());
}

TEST(ServerLauncher, EmptyMarkerListIsReadyOnSpawn) {
    auto options = fastOptions();
    options.readinessMarkers.clear();
    options.launchTimeout = 200ms;
    ServerLauncher launcher(options);
    EXPECT_NO_THROW(launcher.Launch("plain", ServerConfig{"sleep", {"30"}, std::nullopt}).get());
}

TEST(ServerLauncher, CustomReadinessPredicate) {
    auto options = fastOptions();
    options.readiness = [](std::string_view out) { return out.find("READY") != std::string_view::npos; };
    ServerLauncher launcher(options);
    ServerConfig config{"/bin/sh", {"-c", "echo READY 1>&2; exec sleep 30"}, std::nullopt};
    EXPECT_NO_THROW(launcher.Launch("custom", config).get());
}

TEST(ServerLauncher, DeadProbeFailsHealthCheckAndTerminates) {
    SignalLog signals;
    auto options = fastOptions();
    options.livenessProbe = [](pid_t) { return ProbeResult::NotAlive; };
    options.signalSender = signals.sender();
    ServerLauncher launcher(options);

    EXPECT_EQ(launchFailure<HealthError>(launcher, "zombie", readyServer()),
              "Server zombie health check failed: Process is not responding to signals");
    EXPECT_EQ(launcher.GetProcess("zombie"), nullptr);
    EXPECT_TRUE(eventually([&]() {
        std::lock_guard<std::mutex> lk(signals.mu);
        return std::any_of(signals.sent.begin(), signals.sent.end(),
                           [](const std::pair<pid_t, int>& s) { return s.second == SIGTERM; });
    }));
}

TEST(ServerLauncher, ProbeErrorsExhaustRetries) {
    std::atomic<int> probes{0};
    auto options = fastOptions();
    options.healthRetries = 2;
    options.livenessProbe = [&probes](pid_t) {
        ++probes;
        return ProbeResult::Error;
    };
    ServerLauncher launcher(options);
    EXPECT_EQ(launchFailure<HealthError>(launcher, "flaky", readyServer()),
              "Server flaky health check failed: Maximum health check attempts reached");
    EXPECT_EQ(probes.load(), 2);
}

TEST(ServerLauncher, ProbeRecoversWithinRetries) {
    std::atomic<int> probes{0};
    auto options = fastOptions();
    options.livenessProbe = [&probes](pid_t) {
        return ++probes < 2 ? ProbeResult::Error : ProbeResult::Alive;
    };
    ServerLauncher launcher(options);
    EXPECT_NO_THROW(launcher.Launch("recovering", readyServer()).get());
    EXPECT_EQ(probes.load(), 2);
}

TEST(ServerLauncher, HealthTimeoutBoundsRetries) {
    auto options = fastOptions();
    options.healthRetries = 1000;
    options.healthInterval = 50ms;
    options.healthTimeout = 200ms;
    options.livenessProbe = [](pid_t) { return ProbeResult::Error; };
    ServerLauncher launcher(options);
    EXPECT_EQ(launchFailure<HealthError>(launcher, "slow", readyServer()),
              "Server slow health check failed: Health check timeout reached");
}

TEST(ServerLauncher, StubbornServerIsKilled) {
    SignalLog signals;
    auto options = fastOptions();
    options.stopTimeout = 300ms;
    options.signalSender = signals.sender();
    ServerLauncher launcher(options);
    ServerConfig config{"/bin/sh",
                        {"-c", "trap '' TERM; echo 'running on stdio' 1>&2; while true; do sleep 1; done"},
                        std::nullopt};
    auto process = launcher.Launch("stubborn", config).get();
    launcher.Stop("stubborn").get();
    EXPECT_TRUE(signals.contains(process->pid, SIGTERM));
    EXPECT_TRUE(signals.contains(process->pid, SIGKILL));
    ASSERT_TRUE(process->HasExited());
    EXPECT_EQ(process->GetExitStatus()->signal, SIGKILL);
}

TEST(ServerLauncher, StopAllStopsEverything) {
    ServerLauncher launcher(fastOptions());
    auto a = launcher.Launch("a", readyServer());
    auto b = launcher.Launch("b", readyServer());
    auto pa = a.get();
    auto pb = b.get();
    launcher.StopAll().get();
    EXPECT_TRUE(launcher.GetServerNames().empty());
    EXPECT_TRUE(pa->HasExited());
    EXPECT_TRUE(pb->HasExited());
}

TEST(ServerLauncher, CleanupUntracksImmediately) {
    ServerLauncher launcher(fastOptions());
    auto process = launcher.Launch("tmp", readyServer()).get();
    launcher.Cleanup("tmp");
    EXPECT_EQ(launcher.GetProcess("tmp"), nullptr);
    EXPECT_TRUE(eventually([&]() { return process->HasExited(); }));
    launcher.Cleanup("tmp");
}

TEST(ServerLauncher, UnexpectedExitNotifiesHandlers) {
    ServerLauncher launcher(fastOptions());
    std::promise<std::pair<std::string, std::optional<int>>> exited;
    std::promise<std::string> errored;
    launcher.SetExitHandler([&exited](const std::string& name, std::optional<int> code, std::optional<int>) {
        exited.set_value(std::make_pair(name, code));
    });
    launcher.SetErrorHandler([&errored](const ServerError& e) { errored.set_value(e.what()); });

    ServerConfig config{"/bin/sh", {"-c", "echo 'running on stdio' 1>&2; sleep 0.5; exit 3"}, std::nullopt};
    auto process = launcher.Launch("crashy", config).get();

    auto exitFut = exited.get_future();
    ASSERT_EQ(exitFut.wait_for(5s), std::future_status::ready);
    auto [name, code] = exitFut.get();
    EXPECT_EQ(name, "crashy");
    EXPECT_EQ(code, 3);
    auto errFut = errored.get_future();
    ASSERT_EQ(errFut.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(errFut.get(), "Server crashy exited with code 3 (signal: null)");
    EXPECT_EQ(launcher.GetProcess("crashy"), nullptr);
    EXPECT_EQ(process->GetExitStatus()->code, 3);
}

TEST(ServerLauncher, CleanExitSkipsErrorHandler) {
    ServerLauncher launcher(fastOptions());
    std::promise<void> exited;
    std::atomic<int> errors{0};
    launcher.SetExitHandler([&exited](const std::string&, std::optional<int>, std::optional<int>) { exited.set_value(); });
    launcher.SetErrorHandler([&errors](const ServerError&) { ++errors; });

    ServerConfig config{"/bin/sh", {"-c", "echo 'running on stdio' 1>&2; sleep 0.3; exit 0"}, std::nullopt};
    launcher.Launch("done", config).get();
    auto fut = exited.get_future();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(errors.load(), 0);
}

TEST(ServerLauncher, StoppedServerDoesNotNotify) {
    ServerLauncher launcher(fastOptions());
    std::atomic<int> exits{0};
    launcher.SetExitHandler([&exits](const std::string&, std::optional<int>, std::optional<int>) { ++exits; });
    launcher.Launch("fs", readyServer()).get();
    launcher.Stop("fs").get();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(exits.load(), 0);
}

TEST(ServerLauncher, NameIsReusableAfterSpawnFailure) {
    ServerLauncher launcher(fastOptions());
    launchFailure<LaunchError>(launcher, "retry", ServerConfig{"mcphost-definitely-missing-binary", {}, std::nullopt});
    auto process = launcher.Launch("retry", readyServer()).get();
    EXPECT_EQ(launcher.GetProcess("retry"), process);
}

TEST(ServerLauncher, RelaunchAfterCleanupWaitsForOldProcess) {
    SignalLog signals;
    auto options = fastOptions();
    options.stopTimeout = 300ms;
    options.signalSender = signals.sender();
    ServerLauncher launcher(options);
    ServerConfig stubborn{"/bin/sh",
                          {"-c", "trap '' TERM; echo 'running on stdio' 1>&2; while true; do sleep 1; done"},
                          std::nullopt};
    auto old = launcher.Launch("re", stubborn).get();
    launcher.Cleanup("re");
    auto fresh = launcher.Launch("re", readyServer()).get();
    EXPECT_TRUE(old->HasExited());
    EXPECT_TRUE(signals.contains(old->pid, SIGKILL));
    EXPECT_NE(fresh->pid, old->pid);
    EXPECT_EQ(launcher.GetProcess("re"), fresh);
}

TEST(ServerLauncher, NameIsReusableAfterStop) {
    ServerLauncher launcher(fastOptions());
    auto first = launcher.Launch("fs", readyServer()).get();
    launcher.Stop("fs").get();
    auto second = launcher.Launch("fs", readyServer()).get();
    EXPECT_NE(first->pid, second->pid);
}

TEST(LauncherOptions, EnvironmentOverridesDefaults) {
    ::setenv("MCPHOST_LAUNCH_TIMEOUT_MS", "1234", 1);
    ::setenv("MCPHOST_HEALTH_RETRIES", "7", 1);
    auto options = LauncherOptions::FromEnvironment();
    ::unsetenv("MCPHOST_LAUNCH_TIMEOUT_MS");
    ::unsetenv("MCPHOST_HEALTH_RETRIES");
    EXPECT_EQ(options.launchTimeout, 1234ms);
    EXPECT_EQ(options.healthRetries, 7u);
    EXPECT_EQ(options.healthTimeout, 10000ms);
    EXPECT_EQ(options.stopTimeout, 5000ms);
}

TEST(ReadinessMarkers, MarkerPredicate) {
    auto pred = MakeMarkerPredicate({"running on stdio"});
    EXPECT_FALSE(pred(""));
    EXPECT_FALSE(pred("starting up"));
    EXPECT_TRUE(pred("Filesystem server running on stdio"));
    EXPECT_TRUE(MakeMarkerPredicate({})(""));
}
