//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessHandle.cpp
// Purpose: posix_spawnp based child creation with stdio pipes, exit bookkeeping and reaping
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/server/ProcessHandle.h"

namespace mcphost {

namespace {

// Closes both ends of a pipe pair that has not been handed to a ProcessHandle yet.
struct PipePair {
    int fds[2]{-1, -1};

    PipePair() {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
    }
    ~PipePair() {
        for (int& fd : fds) {
            if (fd >= 0) { ::close(fd); fd = -1; }
        }
    }
    PipePair(const PipePair&) = delete;
    PipePair& operator=(const PipePair&) = delete;

    int release(int idx) {
        int fd = fds[idx];
        fds[idx] = -1;
        return fd;
    }
};

struct SpawnFileActions {
    posix_spawn_file_actions_t actions;
    SpawnFileActions() {
        int rc = ::posix_spawn_file_actions_init(&actions);
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_init");
        }
    }
    ~SpawnFileActions() { ::posix_spawn_file_actions_destroy(&actions); }
    void dup2(int from, int to) {
        int rc = ::posix_spawn_file_actions_adddup2(&actions, from, to);
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawn_file_actions_adddup2");
        }
    }
};

struct SpawnAttributes {
    posix_spawnattr_t attr;
    SpawnAttributes() {
        int rc = ::posix_spawnattr_init(&attr);
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawnattr_init");
        }
        // Children start with a default SIGPIPE disposition and an empty signal mask.
        sigset_t defaults;
        sigemptyset(&defaults);
        sigaddset(&defaults, SIGPIPE);
        sigset_t mask;
        sigemptyset(&mask);
        ::posix_spawnattr_setsigdefault(&attr, &defaults);
        ::posix_spawnattr_setsigmask(&attr, &mask);
        ::posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);
    }
    ~SpawnAttributes() { ::posix_spawnattr_destroy(&attr); }
};

void closeFd(int& fd) {
    if (fd < 0) {
        return;
    }
    if (::close(fd) != 0 && errno != EINTR) {
        LOG_WARN("ProcessHandle: close({}) failed (errno={} msg={})", fd, errno, ::strerror(errno));
    }
    fd = -1;
}

} // namespace

std::string SignalName(std::optional<int> signal) {
    if (!signal.has_value()) {
        return "null";
    }
    switch (*signal) {
        case SIGHUP: return "SIGHUP";
        case SIGINT: return "SIGINT";
        case SIGQUIT: return "SIGQUIT";
        case SIGILL: return "SIGILL";
        case SIGABRT: return "SIGABRT";
        case SIGBUS: return "SIGBUS";
        case SIGFPE: return "SIGFPE";
        case SIGKILL: return "SIGKILL";
        case SIGUSR1: return "SIGUSR1";
        case SIGSEGV: return "SIGSEGV";
        case SIGUSR2: return "SIGUSR2";
        case SIGPIPE: return "SIGPIPE";
        case SIGALRM: return "SIGALRM";
        case SIGTERM: return "SIGTERM";
        default: return "SIG" + std::to_string(*signal);
    }
}

ProcessHandle::ProcessHandle(pid_t p, int stdinFd, int stdoutFd, int stderrFd)
    : pid(p), stdinFd_(stdinFd), stdoutFd_(stdoutFd), stderrFd_(stderrFd) {}

ProcessHandle::~ProcessHandle() {
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

bool ProcessHandle::HasExited() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return exit_.has_value();
}

std::optional<ExitStatus> ProcessHandle::GetExitStatus() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return exit_;
}

void ProcessHandle::SetExitStatus(const ExitStatus& status) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!exit_.has_value()) {
        exit_ = status;
    }
}

//==========================================================================================================
// SpawnProcess
// Purpose: Creates three pipes, maps the child ends onto fds 0/1/2 and spawns with PATH lookup.
// Notes:
//   All pipe fds are O_CLOEXEC; dup2 in the child clears the flag on 0/1/2 only, so no other
//   descriptor of this process leaks into the server.
//==========================================================================================================
std::shared_ptr<ProcessHandle> SpawnProcess(const ServerConfig& config) {
    FUNC_SCOPE();
    if (config.command.empty()) {
        throw std::system_error(ENOENT, std::generic_category(), "empty command");
    }

    PipePair inPipe;
    PipePair outPipe;
    PipePair errPipe;

    SpawnFileActions actions;
    actions.dup2(inPipe.fds[0], STDIN_FILENO);
    actions.dup2(outPipe.fds[1], STDOUT_FILENO);
    actions.dup2(errPipe.fds[1], STDERR_FILENO);
    SpawnAttributes attrs;

    std::vector<std::string> argvStore;
    argvStore.reserve(config.args.size() + 1);
    argvStore.push_back(config.command);
    argvStore.insert(argvStore.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    argv.reserve(argvStore.size() + 1);
    for (auto& a : argvStore) argv.push_back(a.data());
    argv.push_back(nullptr);

    const auto env = MergeEnvironment(config.env.value_or(std::map<std::string, std::string>{}));
    std::vector<std::string> envStore;
    envStore.reserve(env.size());
    for (const auto& [k, v] : env) envStore.push_back(k + "=" + v);
    std::vector<char*> envp;
    envp.reserve(envStore.size() + 1);
    for (auto& e : envStore) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, config.command.c_str(), &actions.actions, &attrs.attr, argv.data(), envp.data());
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), "spawn " + config.command);
    }
    if (pid <= 0) {
        throw std::system_error(ESRCH, std::generic_category(), "spawn " + config.command);
    }
    LOG_DEBUG("Spawned '{}' pid={}", config.command, static_cast<long>(pid));

    // Child ends close when the PipePair destructors run.
    return std::make_shared<ProcessHandle>(pid, inPipe.release(1), outPipe.release(0), errPipe.release(0));
}

std::optional<ExitStatus> TryReap(pid_t pid) {
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == 0) {
        return std::nullopt;
    }
    if (r < 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    ExitStatus es;
    if (WIFEXITED(status)) {
        es.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        es.signal = WTERMSIG(status);
    }
    return es;
}

} // namespace mcphost
