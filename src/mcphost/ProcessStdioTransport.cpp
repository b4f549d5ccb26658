//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessStdioTransport.cpp
// Purpose: stdio transport bound to a child process's pipes
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <string.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <time.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/ProcessStdioTransport.hpp"
#include "mcphost/server/ProcessHandle.h"

namespace mcphost {

namespace {

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Writing to a pipe whose reader died raises SIGPIPE on the writing thread. The writer thread blocks
// the signal and consumes any pending instance after EPIPE.
void blockSigpipeOnThisThread() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
}

void consumePendingSigpipe() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    struct timespec zero{0, 0};
    while (::sigtimedwait(&set, nullptr, &zero) > 0) {
    }
}

} // namespace

class ProcessStdioTransport::Impl {
public:
    std::string serverName;
    std::shared_ptr<ProcessHandle> process;
    std::unique_ptr<IContentFramer> framer;

    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::string sessionId;

    std::mutex handlerMutex;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;

    std::thread readerThread;
    std::thread writerThread;
    std::thread timeoutThread;
    int wakeEventFd{-1};

    std::mutex requestMutex;
    std::condition_variable cvTimeout;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requestDeadlines;
    std::atomic<unsigned int> requestCounter{0u};
    std::chrono::milliseconds requestTimeout{30000};

    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};
    std::size_t writeQueueMaxBytes{4 * 1024 * 1024};

    Impl(std::string name, std::shared_ptr<ProcessHandle> proc, FramingMode mode)
        : serverName(std::move(name)), process(std::move(proc)), framer(MakeFramer(mode)) {
        sessionId = "stdio-" + serverName + "-" + (process ? std::to_string(process->pid) : std::string("none"));
        requestTimeout = std::chrono::milliseconds(GetEnvUint64OrDefault("MCPHOST_REQUEST_TIMEOUT_MS", 30000));
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("ProcessStdioTransport[{}]: failed to create eventfd (errno={} msg={})", serverName, errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("ProcessStdioTransport[{}]: eventfd write failed (errno={} msg={})", serverName, errno, ::strerror(errno));
        }
    }

    void reportError(const std::string& msg) {
        ITransport::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = errorHandler;
        }
        if (h) {
            h(msg);
        }
    }

    void failPending(int code, const std::string& message) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [idStr, prom] : pendingRequests) {
            prom.set_value(CreateErrorResponse(JSONRPCId{idStr}, code, message));
        }
        pendingRequests.clear();
        requestDeadlines.clear();
    }

    // Marks the connection lost from inside an I/O thread. Close() still joins the threads.
    void connectionLost(const std::string& why) {
        bool was = connected.exchange(false);
        wake();
        cvWrite.notify_all();
        cvTimeout.notify_all();
        failPending(JSONRPCErrorCodes::ConnectionError, "Server connection lost: " + why);
        if (was) {
            LOG_INFO("ProcessStdioTransport[{}]: {}", serverName, why);
            reportError("ProcessStdioTransport: " + why);
        }
    }

    bool enqueueFrame(const std::string& payload) {
        std::string frame = framer->encode(payload);
        {
            std::unique_lock<std::mutex> lk(writeMutex);
            if (queuedBytes + frame.size() > writeQueueMaxBytes) {
                LOG_ERROR("ProcessStdioTransport[{}]: write queue overflow (queued={} add={} max={})", serverName, queuedBytes, frame.size(), writeQueueMaxBytes);
                lk.unlock();
                connectionLost("write queue overflow");
                return false;
            }
            queuedBytes += frame.size();
            writeQueue.emplace_back(std::move(frame));
        }
        cvWrite.notify_one();
        return true;
    }

    void startReader() {
        readerThread = std::thread([this]() {
            const int fd = process->StdoutFd();
            setNonBlocking(fd);
            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("ProcessStdioTransport[{}]: epoll_create1 failed (errno={} msg={})", serverName, errno, ::strerror(errno));
                connectionLost("epoll_create1 failed");
                return;
            }
            epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = fd;
            (void)::epoll_ctl(ep, EPOLL_CTL_ADD, fd, &evIn);
            if (wakeEventFd >= 0) {
                epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }

            std::string buffer;
            std::vector<char> tmp(8192);
            while (connected) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, 100);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("ProcessStdioTransport[{}]: epoll_wait failed (errno={} msg={})", serverName, errno, ::strerror(errno));
                    connectionLost("epoll_wait failed");
                    break;
                }
                bool readable = false;
                for (int k = 0; k < rc; ++k) {
                    if (events[k].data.fd == fd) {
                        readable = true;
                    } else {
                        uint64_t v = 0;
                        ssize_t r;
                        do { r = ::read(wakeEventFd, &v, sizeof(v)); } while (r < 0 && errno == EINTR);
                    }
                }
                if (!connected) {
                    break;
                }
                if (!readable) {
                    continue;
                }
                // Drain everything available; EOF is only reported after buffered data is processed.
                bool eof = false;
                while (true) {
                    ssize_t n = ::read(fd, tmp.data(), tmp.size());
                    if (n > 0) {
                        buffer.append(tmp.data(), static_cast<std::size_t>(n));
                        continue;
                    }
                    if (n == 0) {
                        eof = true;
                        break;
                    }
                    if (errno == EINTR) {
                        continue;
                    }
                    if (errno != EAGAIN && errno != EWOULDBLOCK) {
                        LOG_ERROR("ProcessStdioTransport[{}]: read error (errno={} msg={})", serverName, errno, ::strerror(errno));
                        eof = true;
                    }
                    break;
                }
                while (connected) {
                    auto framed = framer->tryDecode(buffer);
                    if (!framed.has_value()) break;
                    processMessage(framed.value());
                }
                if (eof) {
                    connectionLost("server closed stdout");
                    break;
                }
            }
            ::close(ep);
        });
    }

    void startWriter() {
        writerThread = std::thread([this]() {
            blockSigpipeOnThisThread();
            const int fd = process->StdinFd();
            setNonBlocking(fd);
            while (connected) {
                std::string frame;
                {
                    std::unique_lock<std::mutex> lk(writeMutex);
                    cvWrite.wait_for(lk, std::chrono::milliseconds(100), [&]{ return !connected || !writeQueue.empty(); });
                    if (!connected) {
                        break;
                    }
                    if (writeQueue.empty()) {
                        continue;
                    }
                    frame = std::move(writeQueue.front());
                    writeQueue.pop_front();
                }
                std::size_t total = 0;
                while (connected && total < frame.size()) {
                    ssize_t w = ::write(fd, frame.data() + total, frame.size() - total);
                    if (w > 0) {
                        total += static_cast<std::size_t>(w);
                    } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                        struct pollfd pfd{fd, POLLOUT, 0};
                        (void)::poll(&pfd, 1, 50);
                    } else if (w < 0 && errno == EINTR) {
                        continue;
                    } else {
                        int err = errno;
                        if (err == EPIPE) {
                            consumePendingSigpipe();
                        }
                        LOG_ERROR("ProcessStdioTransport[{}]: write error (errno={} msg={})", serverName, err, ::strerror(err));
                        connectionLost("write to server stdin failed");
                        break;
                    }
                }
                {
                    std::lock_guard<std::mutex> lk(writeMutex);
                    queuedBytes = (queuedBytes >= frame.size()) ? queuedBytes - frame.size() : 0;
                }
            }
        });
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            std::unique_lock<std::mutex> lock(requestMutex);
            while (connected) {
                cvTimeout.wait_for(lock, std::chrono::milliseconds(50));
                auto now = clock::now();
                std::vector<std::string> expired;
                for (const auto& kv : requestDeadlines) {
                    if (kv.second <= now) expired.push_back(kv.first);
                }
                for (const auto& idStr : expired) {
                    auto it = pendingRequests.find(idStr);
                    if (it != pendingRequests.end()) {
                        LOG_WARN("ProcessStdioTransport[{}]: request {} timed out", serverName, idStr);
                        it->second.set_value(CreateErrorResponse(JSONRPCId{idStr}, JSONRPCErrorCodes::RequestTimeout, "Request timeout"));
                        pendingRequests.erase(it);
                    }
                    requestDeadlines.erase(idStr);
                }
            }
        });
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("ProcessStdioTransport[{}]: received {}", serverName, message);
        switch (ClassifyMessage(message)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(message)) {
                    handleResponse(std::move(response));
                    return;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (request.Deserialize(message)) {
                    handleRequest(request);
                    return;
                }
                break;
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.Deserialize(message)) {
                    ITransport::NotificationHandler h;
                    {
                        std::lock_guard<std::mutex> lk(handlerMutex);
                        h = notificationHandler;
                    }
                    if (h) {
                        h(std::make_unique<JSONRPCNotification>(std::move(notification)));
                    }
                    return;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }
        LOG_WARN("ProcessStdioTransport[{}]: failed to parse message: {}", serverName, message);
    }

    void handleRequest(const JSONRPCRequest& request) {
        ITransport::RequestHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = requestHandler;
        }
        std::unique_ptr<JSONRPCResponse> resp;
        if (!h) {
            resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method);
        } else {
            try {
                resp = h(request);
                if (!resp) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                }
            } catch (const std::exception& e) {
                LOG_ERROR("ProcessStdioTransport[{}]: request handler exception: {}", serverName, e.what());
                resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
            }
        }
        resp->id = request.id;
        (void)enqueueFrame(resp->Serialize());
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = IdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it != pendingRequests.end()) {
            it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
            pendingRequests.erase(it);
        } else {
            LOG_DEBUG("ProcessStdioTransport[{}]: response for unknown id {}", serverName, idStr);
        }
        requestDeadlines.erase(idStr);
    }

    std::string generateRequestId() { return "req-" + std::to_string(++requestCounter); }
};

ProcessStdioTransport::ProcessStdioTransport(std::string serverName, std::shared_ptr<ProcessHandle> process,
                                             FramingMode framing)
    : pImpl(std::make_unique<Impl>(std::move(serverName), std::move(process), framing)) {
    FUNC_SCOPE();
}

ProcessStdioTransport::~ProcessStdioTransport() {
    FUNC_SCOPE();
    if (pImpl->started.load()) {
        Close().get();
    }
}

std::future<void> ProcessStdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (!pImpl->process || pImpl->process->StdinFd() < 0 || pImpl->process->StdoutFd() < 0) {
        promise.set_exception(std::make_exception_ptr(std::runtime_error("Process has no stdio pipes")));
        return fut;
    }
    if (pImpl->started.exchange(true)) {
        promise.set_exception(std::make_exception_ptr(std::runtime_error("Transport already started")));
        return fut;
    }
    LOG_INFO("Starting ProcessStdioTransport for {} (pid={})", pImpl->serverName, static_cast<long>(pImpl->process->pid));
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startWriter();
    pImpl->startTimeouts();
    promise.set_value();
    return fut;
}

std::future<void> ProcessStdioTransport::Close() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->wake();
    pImpl->cvWrite.notify_all();
    pImpl->cvTimeout.notify_all();
    if (pImpl->readerThread.joinable()) {
        pImpl->readerThread.join();
    }
    if (pImpl->writerThread.joinable()) {
        pImpl->writerThread.join();
    }
    if (pImpl->timeoutThread.joinable()) {
        pImpl->timeoutThread.join();
    }
    if (pImpl->started.exchange(false)) {
        LOG_INFO("Closed ProcessStdioTransport for {}", pImpl->serverName);
    }
    pImpl->failPending(JSONRPCErrorCodes::ConnectionError, "Transport closed");
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        pImpl->writeQueue.clear();
        pImpl->queuedBytes = 0;
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool ProcessStdioTransport::IsConnected() const { return pImpl->connected; }

std::string ProcessStdioTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> ProcessStdioTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        LOG_DEBUG("ProcessStdioTransport[{}]: SendRequest while disconnected", pImpl->serverName);
        promise.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionError, "Transport not connected"));
        return future;
    }
    // Preserve caller-provided id if set (string non-empty or int64); otherwise generate a new id
    bool callerSetId = false;
    if (auto s = std::get_if<std::string>(&request->id)) {
        callerSetId = !s->empty();
    } else if (std::holds_alternative<int64_t>(request->id)) {
        callerSetId = true;
    }
    if (!callerSetId) {
        request->id = pImpl->generateRequestId();
    }
    const std::string requestId = IdToString(request->id);
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[requestId] = std::move(promise);
        if (pImpl->requestTimeout.count() > 0) {
            pImpl->requestDeadlines[requestId] = std::chrono::steady_clock::now() + pImpl->requestTimeout;
        }
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("ProcessStdioTransport[{}]: sending {} ({} bytes)", pImpl->serverName, request->method, serialized.size());
    (void)pImpl->enqueueFrame(serialized);
    return future;
}

std::future<void> ProcessStdioTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(std::runtime_error("Transport not connected")));
        return fut;
    }
    if (!pImpl->enqueueFrame(notification->Serialize())) {
        promise.set_exception(std::make_exception_ptr(std::runtime_error("Write queue overflow")));
        return fut;
    }
    promise.set_value();
    return fut;
}

void ProcessStdioTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void ProcessStdioTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->requestHandler = std::move(handler);
}

void ProcessStdioTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void ProcessStdioTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    pImpl->requestTimeout = std::chrono::milliseconds(timeoutMs);
}

void ProcessStdioTransport::SetWriteQueueMaxBytes(std::size_t maxBytes) {
    if (maxBytes == 0) { maxBytes = 1; }
    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    pImpl->writeQueueMaxBytes = maxBytes;
}

std::unique_ptr<ITransport> ProcessStdioTransportFactory::CreateTransport(const std::string& serverName,
                                                                          std::shared_ptr<ProcessHandle> process) {
    return std::make_unique<ProcessStdioTransport>(serverName, std::move(process), framing_);
}

} // namespace mcphost
