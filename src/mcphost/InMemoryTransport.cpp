//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/InMemoryTransport.hpp"

namespace mcphost {

class InMemoryTransport::Impl {
public:
    std::atomic<bool> connected{false};
    std::string sessionId;
    std::mutex handlerMutex;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::mutex peerMutex;
    std::weak_ptr<Impl> peer;
    std::queue<std::string> messageQueue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;
    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;

    Impl() {
        static std::atomic<unsigned int> instanceCounter{0u};
        sessionId = "memory-" + std::to_string(++instanceCounter);
    }

    ~Impl() {
        stopProcessing();
    }

    void stopProcessing() {
        connected = false;
        queueCondition.notify_all();
        if (processingThread.joinable()) {
            processingThread.request_stop();
            if (processingThread.get_id() == std::this_thread::get_id()) {
                processingThread.detach();
            } else {
                processingThread.join();
            }
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            std::unique_lock<std::mutex> lock(queueMutex);
            while (connected && !st.stop_requested()) {
                queueCondition.wait(lock, [this, &st]() { return !messageQueue.empty() || !connected || st.stop_requested(); });
                while (!messageQueue.empty() && connected && !st.stop_requested()) {
                    std::string message = std::move(messageQueue.front());
                    messageQueue.pop();
                    lock.unlock();
                    processMessage(message);
                    lock.lock();
                }
            }
        });
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Processing in-memory message: {}", message);
        switch (ClassifyMessage(message)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(message)) {
                    handleResponse(std::move(response));
                }
                return;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (request.Deserialize(message)) {
                    handleRequest(request);
                }
                return;
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
                }
                return;
            }
            case MessageKind::Unknown:
                LOG_WARN("InMemoryTransport: dropping unrecognized message");
                return;
        }
    }

    void handleRequest(const JSONRPCRequest& req) {
        ITransport::RequestHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = requestHandler;
        }
        std::unique_ptr<JSONRPCResponse> resp;
        if (!h) {
            resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        } else {
            try {
                resp = h(req);
                if (!resp) {
                    resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                }
            } catch (const std::exception& e) {
                LOG_ERROR("InMemory request handler exception: {}", e.what());
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
            }
        }
        resp->id = req.id;
        sendToPeer(resp->Serialize());
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = IdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it != pendingRequests.end()) {
            it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
            pendingRequests.erase(it);
        }
    }

    void enqueueMessage(const std::string& message) {
        std::lock_guard<std::mutex> lock(queueMutex);
        messageQueue.push(message);
        queueCondition.notify_one();
    }

    bool sendToPeer(const std::string& message) {
        std::shared_ptr<Impl> p;
        {
            std::lock_guard<std::mutex> lock(peerMutex);
            p = peer.lock();
        }
        if (!p || !p->connected.load()) {
            LOG_WARN("InMemoryTransport: peer not connected; dropping message");
            return false;
        }
        p->enqueueMessage(message);
        return true;
    }

    void failPending(const std::string& message) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [idStr, prom] : pendingRequests) {
            prom.set_value(CreateErrorResponse(JSONRPCId{idStr}, JSONRPCErrorCodes::ConnectionError, message));
        }
        pendingRequests.clear();
    }

    std::string generateRequestId() { return "mem-req-" + std::to_string(++requestCounter); }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    pImpl->stopProcessing();
    pImpl->failPending("Transport closed");
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    transport1->pImpl->peer = transport2->pImpl;
    transport2->pImpl->peer = transport1->pImpl;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
    if (!pImpl->connected.exchange(true)) {
        pImpl->startProcessing();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->stopProcessing();
    pImpl->failPending("Transport closed");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    // Preserve caller-provided id if set (string non-empty or int64); otherwise generate one.
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
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionError, "Transport not connected"));
        return future;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        pImpl->pendingRequests[requestId] = std::move(promise);
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("Sending in-memory request: {}", serialized);
    if (!pImpl->sendToPeer(serialized)) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(requestId);
        if (it != pImpl->pendingRequests.end()) {
            it->second.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionError, "Peer not connected"));
            pImpl->pendingRequests.erase(it);
        }
    }
    return future;
}

std::future<void> InMemoryTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::string serialized = notification->Serialize();
    LOG_DEBUG("Sending in-memory notification: {}", serialized);
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (!pImpl->sendToPeer(serialized)) {
        ITransport::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
            h = pImpl->errorHandler;
        }
        if (h) {
            h("Peer not connected");
        }
        promise.set_exception(std::make_exception_ptr(std::runtime_error("Peer not connected")));
        return fut;
    }
    promise.set_value();
    return fut;
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->requestHandler = std::move(handler);
}

} // namespace mcphost
