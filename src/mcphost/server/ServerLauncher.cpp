//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerLauncher.cpp
// Purpose: Process supervision on a boost::asio io_context (readiness, health check, exit, stop)
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/server/ServerLauncher.h"

namespace mcphost {
namespace net = boost::asio;
using Clock = std::chrono::steady_clock;

namespace {

constexpr std::size_t kDiagnosticWindow = 4096;
constexpr auto kReapPollInterval = std::chrono::milliseconds(20);

//==========================================================================================================
// AsyncEvent
// Purpose: One-shot flag that io_context coroutines can wait on with a deadline. Only touched from the
//          io thread, so it needs no locking.
//==========================================================================================================
class AsyncEvent {
public:
    explicit AsyncEvent(net::any_io_executor ex) : executor_(std::move(ex)) {}

    bool IsSet() const { return set_; }

    void Set() {
        if (set_) {
            return;
        }
        set_ = true;
        for (auto* timer : waiters_) {
            timer->cancel();
        }
    }

    // True when the event was set before the deadline.
    net::awaitable<bool> WaitUntil(Clock::time_point deadline) {
        if (set_) {
            co_return true;
        }
        net::steady_timer timer(executor_, deadline);
        waiters_.push_back(&timer);
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), &timer), waiters_.end());
        co_return set_;
    }

    net::awaitable<bool> WaitFor(Clock::duration timeout) {
        return WaitUntil(Clock::now() + timeout);
    }

    net::awaitable<bool> Wait() {
        return WaitUntil(Clock::time_point::max());
    }

private:
    net::any_io_executor executor_;
    bool set_{false};
    std::vector<net::steady_timer*> waiters_;
};

//==========================================================================================================
// ProcessRecord
// Purpose: Supervision state of one spawned process. Everything except `state` is io-thread only.
//==========================================================================================================
struct ProcessRecord {
    ProcessRecord(std::string n, std::shared_ptr<ProcessHandle> h, const net::any_io_executor& ex)
        : name(std::move(n)), handle(std::move(h)), readinessDecided(ex), exited(ex) {}

    const std::string name;
    const std::shared_ptr<ProcessHandle> handle;
    std::atomic<ProcessState> state{ProcessState::NotStarted};

    AsyncEvent readinessDecided;
    AsyncEvent exited;
    bool readinessSeen{false};
    std::optional<std::string> streamError;
    std::string readinessWindow;
    std::string partialLine;
    std::unique_ptr<net::posix::stream_descriptor> diagnostics;
};

int openPidfd(pid_t pid) {
#ifdef SYS_pidfd_open
    return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
#else
    (void)pid;
    errno = ENOSYS;
    return -1;
#endif
}

std::string describeExit(const ExitStatus& status) {
    return std::format("code {} (signal: {})",
                       status.code.has_value() ? std::to_string(*status.code) : std::string("null"),
                       SignalName(status.signal));
}

} // namespace

ReadinessPredicate MakeMarkerPredicate(std::vector<std::string> markers) {
    return [markers = std::move(markers)](std::string_view output) {
        if (markers.empty()) {
            return true;
        }
        return std::any_of(markers.begin(), markers.end(), [output](const std::string& m) {
            return output.find(m) != std::string_view::npos;
        });
    };
}

ProbeResult DefaultLivenessProbe(pid_t pid) {
    if (::kill(pid, 0) == 0) {
        return ProbeResult::Alive;
    }
    return errno == ESRCH ? ProbeResult::NotAlive : ProbeResult::Error;
}

LauncherOptions LauncherOptions::FromEnvironment() {
    LauncherOptions o;
    o.launchTimeout = std::chrono::milliseconds(GetEnvUint64OrDefault("MCPHOST_LAUNCH_TIMEOUT_MS", o.launchTimeout.count()));
    o.healthTimeout = std::chrono::milliseconds(GetEnvUint64OrDefault("MCPHOST_HEALTH_TIMEOUT_MS", o.healthTimeout.count()));
    o.healthRetries = static_cast<unsigned int>(GetEnvUint64OrDefault("MCPHOST_HEALTH_RETRIES", o.healthRetries));
    o.healthInterval = std::chrono::milliseconds(GetEnvUint64OrDefault("MCPHOST_HEALTH_INTERVAL_MS", o.healthInterval.count()));
    o.stopTimeout = std::chrono::milliseconds(GetEnvUint64OrDefault("MCPHOST_STOP_TIMEOUT_MS", o.stopTimeout.count()));
    return o;
}

class ServerLauncher::Impl {
public:
    using RecordPtr = std::shared_ptr<ProcessRecord>;

    LauncherOptions options;
    ReadinessPredicate readiness;
    LivenessProbe probe;
    SignalSender signalSender;

    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> workGuard;
    std::thread ioThread;

    mutable std::mutex mutex;
    std::map<std::string, RecordPtr> processes;
    // Names between Launch and spawn; they count as taken for the duplicate check.
    std::set<std::string> reserved;
    // Cleaned-up records still terminating. A new launch of the same name waits for them.
    std::multimap<std::string, RecordPtr> retiring;
    // Every record ever created, so destruction can reap what is still terminating in the background.
    std::vector<std::weak_ptr<ProcessRecord>> allRecords;

    std::mutex handlerMutex;
    IServerLauncher::ErrorHandler errorHandler;
    IServerLauncher::ExitHandler exitHandler;

    explicit Impl(LauncherOptions o)
        : options(std::move(o)), workGuard(net::make_work_guard(ioc)) {
        readiness = options.readiness ? options.readiness : MakeMarkerPredicate(options.readinessMarkers);
        probe = options.livenessProbe ? options.livenessProbe : LivenessProbe(&DefaultLivenessProbe);
        signalSender = options.signalSender ? options.signalSender : SignalSender([](pid_t pid, int sig) { return ::kill(pid, sig); });
        ioThread = std::thread([this]() {
            for (;;) {
                try {
                    ioc.run();
                    return;
                } catch (const std::exception& e) {
                    LOG_ERROR("ServerLauncher io loop error: {}", e.what());
                }
            }
        });
    }

    ~Impl() {
        workGuard.reset();
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        killLeftovers();
        std::lock_guard<std::mutex> lk(mutex);
        processes.clear();
        retiring.clear();
    }

    // With the io thread gone nothing else can reap, so pids cannot be recycled under us here.
    void killLeftovers() {
        std::vector<std::weak_ptr<ProcessRecord>> records;
        {
            std::lock_guard<std::mutex> lk(mutex);
            records.swap(allRecords);
        }
        for (auto& weak : records) {
            auto rec = weak.lock();
            if (!rec || rec->handle->HasExited()) {
                continue;
            }
            LOG_WARN("Server {} (pid {}) still running at shutdown; killing", rec->name, static_cast<long>(rec->handle->pid));
            if (::kill(rec->handle->pid, SIGKILL) != 0 && errno != ESRCH) {
                LOG_ERROR("kill({}, SIGKILL) failed (errno={} msg={})", static_cast<long>(rec->handle->pid), errno, ::strerror(errno));
            }
            int status = 0;
            pid_t r;
            do {
                r = ::waitpid(rec->handle->pid, &status, 0);
            } while (r < 0 && errno == EINTR);
            rec->handle->MarkKilled();
            rec->handle->SetExitStatus(ExitStatus{std::nullopt, SIGKILL});
        }
    }

    ////////////////////////////////////////// Bookkeeping //////////////////////////////////////////

    RecordPtr find(const std::string& name) const {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = processes.find(name);
        return it == processes.end() ? nullptr : it->second;
    }

    // Untracks the record if it is still the one registered under its name.
    bool deregister(const RecordPtr& rec) {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = processes.find(rec->name);
        if (it == processes.end() || it->second != rec) {
            return false;
        }
        processes.erase(it);
        return true;
    }

    bool transition(ProcessRecord& rec, ProcessState to) {
        const ProcessState from = rec.state.load();
        if (!IsValidTransition(from, to)) {
            LOG_DEBUG("Server {}: rejected transition {} -> {}", rec.name, ToString(from), ToString(to));
            return false;
        }
        rec.state.store(to);
        LOG_DEBUG("Server {}: {} -> {}", rec.name, ToString(from), ToString(to));
        return true;
    }

    void sendSignal(ProcessRecord& rec, int sig) {
        // Signals and reaping both happen on the io thread, so a reaped pid is never signalled.
        if (rec.handle->HasExited()) {
            return;
        }
        rec.handle->MarkKilled();
        if (signalSender(rec.handle->pid, sig) != 0) {
            LOG_WARN("Server {}: sending {} to pid {} failed (errno={} msg={})", rec.name, SignalName(sig),
                     static_cast<long>(rec.handle->pid), errno, ::strerror(errno));
        }
    }

    auto logFailure(std::string what) {
        return [what = std::move(what)](std::exception_ptr ep) {
            if (!ep) {
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                LOG_ERROR("{} failed: {}", what, e.what());
            }
        };
    }

    std::future<void> spawnWithFuture(net::awaitable<void> work) {
        auto promise = std::make_shared<std::promise<void>>();
        auto fut = promise->get_future();
        net::co_spawn(ioc, std::move(work), [promise](std::exception_ptr ep) {
            if (ep) {
                promise->set_exception(ep);
            } else {
                promise->set_value();
            }
        });
        return fut;
    }

    ////////////////////////////////////////// Observers //////////////////////////////////////////

    void notifyUnexpectedExit(const ProcessRecord& rec, const ExitStatus& status) {
        IServerLauncher::ExitHandler onExit;
        IServerLauncher::ErrorHandler onError;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            onExit = exitHandler;
            onError = errorHandler;
        }
        try {
            if (onExit) {
                onExit(rec.name, status.code, status.signal);
            }
            const bool abnormal = (status.code.has_value() && *status.code != 0) || status.signal.has_value();
            if (abnormal && onError) {
                onError(ExitError(rec.name, status.code, status.signal));
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Server {}: exit observer threw: {}", rec.name, e.what());
        }
    }

    ////////////////////////////////////////// Coroutines //////////////////////////////////////////

    // Drains the child's stderr for the whole process lifetime: logs each line, feeds the readiness
    // predicate until it matches. An undrained pipe would eventually block the child.
    net::awaitable<void> readDiagnostics(RecordPtr rec) {
        std::array<char, 4096> buf{};
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = co_await rec->diagnostics->async_read_some(net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (ec != net::error::eof && ec != net::error::operation_aborted && !rec->readinessSeen) {
                    rec->streamError = std::format("diagnostic stream error: {}", ec.message());
                    rec->readinessDecided.Set();
                }
                if (!rec->partialLine.empty()) {
                    LOG_DEBUG("[{}] {}", rec->name, rec->partialLine);
                    rec->partialLine.clear();
                }
                co_return;
            }
            const std::string_view chunk(buf.data(), n);
            logLines(*rec, chunk);
            if (!rec->readinessSeen) {
                rec->readinessWindow.append(chunk);
                if (readiness(rec->readinessWindow)) {
                    rec->readinessSeen = true;
                    rec->readinessWindow.clear();
                    rec->readinessDecided.Set();
                } else if (rec->readinessWindow.size() > kDiagnosticWindow) {
                    rec->readinessWindow.erase(0, rec->readinessWindow.size() - kDiagnosticWindow);
                }
            }
        }
    }

    void logLines(ProcessRecord& rec, std::string_view chunk) {
        rec.partialLine.append(chunk);
        std::size_t start = 0;
        for (;;) {
            auto nl = rec.partialLine.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            std::string_view line(rec.partialLine.data() + start, nl - start);
            if (!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            LOG_DEBUG("[{}] {}", rec.name, line);
            start = nl + 1;
        }
        rec.partialLine.erase(0, start);
        if (rec.partialLine.size() > kDiagnosticWindow) {
            LOG_DEBUG("[{}] {}", rec.name, rec.partialLine);
            rec.partialLine.clear();
        }
    }

    // Waits for the child to terminate (pidfd readable, or polling waitpid when pidfd is unavailable),
    // reaps it and publishes the exit.
    net::awaitable<void> watchExit(RecordPtr rec) {
        auto ex = co_await net::this_coro::executor;
        const pid_t pid = rec->handle->pid;
        const int pidfd = openPidfd(pid);
        if (pidfd >= 0) {
            net::posix::stream_descriptor pd(ex, pidfd);
            boost::system::error_code ec;
            co_await pd.async_wait(net::posix::stream_descriptor::wait_read, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_WARN("Server {}: pidfd wait failed ({}); polling for exit", rec->name, ec.message());
            }
        } else {
            LOG_DEBUG("Server {}: pidfd unavailable (errno={}); polling for exit", rec->name, errno);
        }

        net::steady_timer poll(ex);
        ExitStatus status;
        for (;;) {
            std::optional<ExitStatus> reaped;
            try {
                reaped = TryReap(pid);
            } catch (const std::system_error& e) {
                LOG_WARN("Server {}: {}; exit status unknown", rec->name, e.what());
                reaped = ExitStatus{};
            }
            if (reaped.has_value()) {
                status = *reaped;
                break;
            }
            poll.expires_after(kReapPollInterval);
            co_await poll.async_wait(net::use_awaitable);
        }
        onExit(rec, status);
    }

    void onExit(const RecordPtr& rec, const ExitStatus& status) {
        rec->handle->SetExitStatus(status);
        const ProcessState before = rec->state.load();
        transition(*rec, ProcessState::Exited);
        rec->exited.Set();
        rec->readinessDecided.Set();
        if (rec->diagnostics) {
            boost::system::error_code ec;
            rec->diagnostics->cancel(ec);
        }

        if (before == ProcessState::Live && deregister(rec)) {
            LOG_WARN("Server {} exited unexpectedly with {}", rec->name, describeExit(status));
            notifyUnexpectedExit(*rec, status);
        } else {
            LOG_INFO("Server {} exited with {}", rec->name, describeExit(status));
        }
    }

    net::awaitable<void> awaitReadiness(RecordPtr rec) {
        if (readiness(std::string_view{})) {
            rec->readinessSeen = true;
        }
        bool decided = rec->readinessSeen;
        if (!decided) {
            decided = co_await rec->readinessDecided.WaitFor(options.launchTimeout);
        }
        if (auto st = rec->handle->GetExitStatus()) {
            throw ExitError(rec->name, st->code, st->signal);
        }
        if (rec->streamError.has_value()) {
            throw LaunchError(rec->name, *rec->streamError);
        }
        if (!decided || !rec->readinessSeen) {
            throw LaunchError(rec->name, "Server startup timeout reached");
        }
        if (!transition(*rec, ProcessState::Ready)) {
            throw LaunchError(rec->name, std::format("Server left startup in state {}", ToString(rec->state.load())));
        }
    }

    //==========================================================================================================
    // runHealthCheck
    // Purpose: Bounded liveness probing of a Ready process.
    // Notes:
    //   - A probe reporting the process gone fails at once; probe errors are retried.
    //   - The interval wait doubles as an exit wait, so a crash mid-check surfaces as ExitError.
    //==========================================================================================================
    net::awaitable<void> runHealthCheck(RecordPtr rec) {
        if (rec->state.load() != ProcessState::Ready) {
            throw HealthError(rec->name, std::format("Cannot health check a process in state {}", ToString(rec->state.load())));
        }
        const auto deadline = Clock::now() + options.healthTimeout;
        const unsigned int attempts = std::max(1u, options.healthRetries);
        for (unsigned int attempt = 1;; ++attempt) {
            if (auto st = rec->handle->GetExitStatus()) {
                throw ExitError(rec->name, st->code, st->signal);
            }
            if (Clock::now() >= deadline) {
                throw HealthError(rec->name, "Health check timeout reached");
            }
            const ProbeResult result = probe(rec->handle->pid);
            if (result == ProbeResult::Alive) {
                LOG_DEBUG("Server {}: health probe {} succeeded", rec->name, attempt);
                co_return;
            }
            if (result == ProbeResult::NotAlive) {
                throw HealthError(rec->name, "Process is not responding to signals");
            }
            LOG_WARN("Server {}: health probe {}/{} failed", rec->name, attempt, attempts);
            if (attempt >= attempts) {
                throw HealthError(rec->name, "Maximum health check attempts reached");
            }
            const auto next = std::min(Clock::now() + options.healthInterval, deadline);
            co_await rec->exited.WaitUntil(next);
        }
    }

    net::awaitable<void> superviseLaunch(RecordPtr rec, std::shared_ptr<std::promise<std::shared_ptr<ProcessHandle>>> promise) {
        std::exception_ptr failure;
        try {
            transition(*rec, ProcessState::Starting);
            startWatchers(rec);
            co_await awaitReadiness(rec);
            co_await runHealthCheck(rec);
            if (!transition(*rec, ProcessState::Live)) {
                if (auto st = rec->handle->GetExitStatus()) {
                    throw ExitError(rec->name, st->code, st->signal);
                }
                throw LaunchError(rec->name, std::format("Server left startup in state {}", ToString(rec->state.load())));
            }
        } catch (const ServerError& e) {
            LOG_ERROR("{}", e.what());
            failure = std::current_exception();
        } catch (const std::exception& e) {
            LOG_ERROR("Server {} launch failed: {}", rec->name, e.what());
            failure = std::make_exception_ptr(LaunchError(rec->name, e.what()));
        }
        if (failure) {
            transition(*rec, ProcessState::Failed);
            if (deregister(rec)) {
                std::lock_guard<std::mutex> lk(mutex);
                retiring.emplace(rec->name, rec);
            }
            net::co_spawn(ioc, retire(rec), logFailure("Terminating server " + rec->name));
            promise->set_exception(failure);
            co_return;
        }
        LOG_INFO("Server {} is live (pid {})", rec->name, static_cast<long>(rec->handle->pid));
        promise->set_value(rec->handle);
    }

    void startWatchers(const RecordPtr& rec) {
        const int fd = ::fcntl(rec->handle->StderrFd(), F_DUPFD_CLOEXEC, 0);
        if (fd < 0) {
            rec->streamError = std::format("diagnostic stream unavailable (errno={} msg={})", errno, ::strerror(errno));
        } else {
            rec->diagnostics = std::make_unique<net::posix::stream_descriptor>(ioc, fd);
            net::co_spawn(ioc, readDiagnostics(rec), logFailure("Reading diagnostics of " + rec->name));
        }
        net::co_spawn(ioc, watchExit(rec), logFailure("Watching exit of " + rec->name));
    }

    // SIGTERM, then SIGKILL after the stop timeout. Returns once the child is reaped or given up on.
    net::awaitable<void> terminate(RecordPtr rec) {
        if (rec->handle->HasExited()) {
            co_return;
        }
        sendSignal(*rec, SIGTERM);
        if (co_await rec->exited.WaitFor(options.stopTimeout)) {
            co_return;
        }
        LOG_WARN("Server {} did not exit within {} ms; sending SIGKILL", rec->name, options.stopTimeout.count());
        sendSignal(*rec, SIGKILL);
        if (!co_await rec->exited.WaitFor(options.stopTimeout)) {
            LOG_ERROR("Server {} (pid {}) still running after SIGKILL", rec->name, static_cast<long>(rec->handle->pid));
        }
    }

    net::awaitable<void> stopProcess(RecordPtr rec) {
        LOG_INFO("Stopping server {}", rec->name);
        transition(*rec, ProcessState::Stopping);
        co_await terminate(rec);
        deregister(rec);
    }

    net::awaitable<void> retire(RecordPtr rec) {
        transition(*rec, ProcessState::Stopping);
        co_await terminate(rec);
        std::lock_guard<std::mutex> lk(mutex);
        auto [first, last] = retiring.equal_range(rec->name);
        for (auto it = first; it != last; ++it) {
            if (it->second == rec) {
                retiring.erase(it);
                break;
            }
        }
    }

    // Waits for processes of this name that Cleanup is still terminating, so two never overlap.
    net::awaitable<void> awaitRetired(std::string name) {
        std::vector<RecordPtr> pending;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto [first, last] = retiring.equal_range(name);
            for (auto it = first; it != last; ++it) {
                pending.push_back(it->second);
            }
        }
        for (auto& old : pending) {
            LOG_INFO("Server {}: waiting for previous process (pid {}) to exit", name, static_cast<long>(old->handle->pid));
            if (!co_await old->exited.WaitFor(2 * options.stopTimeout + kReapPollInterval)) {
                LOG_WARN("Server {}: previous process (pid {}) is still running; launching anyway", name,
                         static_cast<long>(old->handle->pid));
            }
        }
    }

    void releaseReservation(const std::string& name) {
        std::lock_guard<std::mutex> lk(mutex);
        reserved.erase(name);
    }

    //==========================================================================================================
    // startProcess
    // Purpose: Spawns the reserved name on the io thread and hands the record to superviseLaunch.
    // Notes:
    //   The spawn runs without the bookkeeping mutex; the reservation keeps duplicates out meanwhile.
    //==========================================================================================================
    net::awaitable<void> startProcess(std::string name, ServerConfig config,
                                      std::shared_ptr<std::promise<std::shared_ptr<ProcessHandle>>> promise) {
        co_await awaitRetired(name);
        std::shared_ptr<ProcessHandle> handle;
        try {
            handle = SpawnProcess(config);
        } catch (const std::system_error& e) {
            LOG_ERROR("Server {}: spawn failed: {}", name, e.what());
            releaseReservation(name);
            promise->set_exception(std::make_exception_ptr(LaunchError(name, std::string("Failed to get process ID: ") + e.what())));
            co_return;
        } catch (const std::exception& e) {
            LOG_ERROR("Server {}: spawn failed: {}", name, e.what());
            releaseReservation(name);
            promise->set_exception(std::make_exception_ptr(LaunchError(name, e.what())));
            co_return;
        }
        auto rec = std::make_shared<ProcessRecord>(name, std::move(handle), ioc.get_executor());
        {
            std::lock_guard<std::mutex> lk(mutex);
            reserved.erase(name);
            processes[name] = rec;
            allRecords.erase(std::remove_if(allRecords.begin(), allRecords.end(),
                                            [](const std::weak_ptr<ProcessRecord>& w) { return w.expired(); }),
                             allRecords.end());
            allRecords.push_back(rec);
        }
        LOG_INFO("Launching server {}: {} (pid {})", name, config.command, static_cast<long>(rec->handle->pid));
        co_await superviseLaunch(rec, promise);
    }

    net::awaitable<void> stopAll(std::vector<RecordPtr> recs) {
        if (recs.empty()) {
            co_return;
        }
        auto ex = co_await net::this_coro::executor;
        auto remaining = std::make_shared<std::size_t>(recs.size());
        auto done = std::make_shared<AsyncEvent>(ex);
        for (auto& rec : recs) {
            net::co_spawn(ex, stopProcess(rec), [remaining, done, name = rec->name](std::exception_ptr ep) {
                if (ep) {
                    LOG_ERROR("Stopping server {} failed: {}", name, DescribeException(ep));
                }
                if (--*remaining == 0) {
                    done->Set();
                }
            });
        }
        co_await done->Wait();
    }
};

ServerLauncher::ServerLauncher() : ServerLauncher(LauncherOptions::FromEnvironment()) {}

ServerLauncher::ServerLauncher(LauncherOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

ServerLauncher::~ServerLauncher() {
    FUNC_SCOPE();
    try {
        StopAll().get();
    } catch (const std::exception& e) {
        LOG_ERROR("ServerLauncher shutdown: stopping servers failed: {}", e.what());
    }
}

std::future<std::shared_ptr<ProcessHandle>> ServerLauncher::Launch(const std::string& name, const ServerConfig& config) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<std::shared_ptr<ProcessHandle>>>();
    auto fut = promise->get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->processes.count(name) != 0 || pImpl->reserved.count(name) != 0) {
            promise->set_exception(std::make_exception_ptr(LaunchError(name, "Server is already running")));
            return fut;
        }
        pImpl->reserved.insert(name);
    }
    net::co_spawn(pImpl->ioc, pImpl->startProcess(name, config, promise), pImpl->logFailure("Launching server " + name));
    return fut;
}

std::future<void> ServerLauncher::Stop(const std::string& name) {
    FUNC_SCOPE();
    auto rec = pImpl->find(name);
    if (!rec) {
        LOG_DEBUG("Stop: server {} is not running", name);
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
    return pImpl->spawnWithFuture(pImpl->stopProcess(rec));
}

std::future<void> ServerLauncher::StopAll() {
    FUNC_SCOPE();
    std::vector<Impl::RecordPtr> recs;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (const auto& [name, rec] : pImpl->processes) {
            recs.push_back(rec);
        }
    }
    return pImpl->spawnWithFuture(pImpl->stopAll(std::move(recs)));
}

std::shared_ptr<ProcessHandle> ServerLauncher::GetProcess(const std::string& name) const {
    auto rec = pImpl->find(name);
    return rec ? rec->handle : nullptr;
}

std::vector<std::string> ServerLauncher::GetServerNames() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<std::string> names;
    names.reserve(pImpl->processes.size());
    for (const auto& [name, rec] : pImpl->processes) {
        names.push_back(name);
    }
    return names;
}

void ServerLauncher::Cleanup(const std::string& name) {
    FUNC_SCOPE();
    Impl::RecordPtr rec;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->processes.find(name);
        if (it == pImpl->processes.end()) {
            return;
        }
        rec = it->second;
        pImpl->processes.erase(it);
        pImpl->retiring.emplace(name, rec);
    }
    LOG_INFO("Cleaning up server {}", name);
    net::co_spawn(pImpl->ioc, pImpl->retire(rec), pImpl->logFailure("Cleaning up server " + name));
}

void ServerLauncher::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void ServerLauncher::SetExitHandler(ExitHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->exitHandler = std::move(handler);
}

std::optional<ProcessState> ServerLauncher::GetState(const std::string& name) const {
    auto rec = pImpl->find(name);
    if (!rec) {
        return std::nullopt;
    }
    return rec->state.load();
}

const LauncherOptions& ServerLauncher::GetOptions() const {
    return pImpl->options;
}

} // namespace mcphost
