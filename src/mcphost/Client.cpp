//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Protocol client implementation (coroutine based, futures at the API boundary)
//==========================================================================================================

#include <format>
#include <mutex>
#include <set>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphost/Client.h"
#include "mcphost/async/Task.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {

constexpr std::size_t kMaxListPages = 1000;

[[noreturn]] void throwProtocol(const std::string& message) {
    throw errors::McpException(errors::makeError(JSONRPCErrorCodes::ProtocolError, message));
}

const JSONValue::Object& requireObject(const JSONValue& v, const char* what) {
    const auto* obj = std::get_if<JSONValue::Object>(&v.value);
    if (!obj) {
        throwProtocol(std::format("{} result is not an object", what));
    }
    return *obj;
}

ListPage parseListPage(const JSONValue& result, const char* method, const char* key) {
    const auto& obj = requireObject(result, method);
    ListPage page;
    if (const JSONValue* arr = FindMember(obj, key)) {
        const auto* items = std::get_if<JSONValue::Array>(&arr->value);
        if (!items) {
            throwProtocol(std::format("{} result member '{}' is not an array", method, key));
        }
        page.items.reserve(items->size());
        for (const auto& item : *items) {
            if (item) page.items.push_back(*item);
        }
    }
    if (const JSONValue* cur = FindMember(obj, "nextCursor")) {
        if (auto s = std::get_if<std::string>(&cur->value)) {
            if (!s->empty()) page.nextCursor = *s;
        } else if (auto n = std::get_if<int64_t>(&cur->value)) {
            page.nextCursor = std::to_string(*n);
        }
    }
    return page;
}

} // namespace

class Client::Impl {
public:
    mutable std::mutex handlerMutex;
    std::unordered_map<std::string, IClient::NotificationHandler> notificationHandlers;
    IClient::ErrorHandler errorHandler;
    // Declared last so its threads stop before the handler state above is destroyed.
    std::unique_ptr<ITransport> transport;

    void onNotification(std::unique_ptr<JSONRPCNotification> note) {
        if (!note) {
            return;
        }
        IClient::NotificationHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            auto it = notificationHandlers.find(note->method);
            if (it != notificationHandlers.end()) {
                h = it->second;
            }
        }
        if (!h) {
            LOG_DEBUG("Client: unhandled notification {}", note->method);
            return;
        }
        h(note->method, note->params.value_or(JSONValue{}));
    }

    void onError(const std::string& err) {
        IClient::ErrorHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = errorHandler;
        }
        if (h) {
            h(err);
        }
    }

    async::Task<void> coConnect(std::unique_ptr<ITransport> t);
    async::Task<void> coDisconnect();
    async::Task<JSONValue> coRequest(std::string method, std::optional<JSONValue> params);
    async::Task<InitializeResult> coInitialize(Implementation clientInfo);
    async::Task<ListPage> coListPage(std::string method, std::string key, std::optional<std::string> cursor);
    async::Task<std::vector<JSONValue>> coListAll(std::string method, std::string key);

    async::Task<void> coPing() {
        (void)co_await async::makeFutureAwaitable(coRequest(Methods::Ping, std::nullopt).toFuture());
        co_return;
    }
};

async::Task<void> Client::Impl::coConnect(std::unique_ptr<ITransport> t) {
    FUNC_SCOPE();
    if (!t) {
        throw std::invalid_argument("Connect: null transport");
    }
    transport = std::move(t);
    transport->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
        onNotification(std::move(n));
    });
    transport->SetErrorHandler([this](const std::string& err) {
        LOG_WARN("Client transport error: {}", err);
        onError(err);
    });
    co_await async::makeFutureAwaitable(transport->Start());
    LOG_DEBUG("Client connected (session {})", transport->GetSessionId());
    co_return;
}

async::Task<void> Client::Impl::coDisconnect() {
    FUNC_SCOPE();
    if (!transport) {
        co_return;
    }
    try {
        co_await async::makeFutureAwaitable(transport->Close());
    } catch (const std::exception& e) {
        LOG_WARN("Disconnect: transport close failed: {}", e.what());
    }
    co_return;
}

//==========================================================================================================
// coRequest
// Purpose: One JSON-RPC round trip. Error responses, including transport-synthesized ones (timeout,
//          closed connection), are raised as McpException; a success without a result is a protocol error.
//==========================================================================================================
async::Task<JSONValue> Client::Impl::coRequest(std::string method, std::optional<JSONValue> params) {
    if (!transport || !transport->IsConnected()) {
        throw errors::McpException(errors::makeError(JSONRPCErrorCodes::ConnectionError, "Client not connected"));
    }
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = method;
    request->params = std::move(params);
    LOG_DEBUG("Client request: {}", method);
    auto response = co_await async::makeFutureAwaitable(transport->SendRequest(std::move(request)));
    if (!response) {
        throw errors::McpException(errors::makeError(JSONRPCErrorCodes::InternalError, "Null response for " + method));
    }
    errors::throwIfError(*response);
    if (!response->result.has_value()) {
        throwProtocol("Response to " + method + " carries no result");
    }
    co_return std::move(response->result.value());
}

async::Task<InitializeResult> Client::Impl::coInitialize(Implementation clientInfo) {
    FUNC_SCOPE();
    JSONValue::Object paramsObj;
    paramsObj["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    paramsObj["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    JSONValue::Object ci;
    ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
    ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
    paramsObj["clientInfo"] = std::make_shared<JSONValue>(std::move(ci));

    LOG_INFO("Initializing client {} {}", clientInfo.name, clientInfo.version);
    JSONValue result = co_await async::makeFutureAwaitable(
        coRequest(Methods::Initialize, JSONValue{std::move(paramsObj)}).toFuture());

    const auto& obj = requireObject(result, Methods::Initialize);
    InitializeResult out;
    auto version = GetStringMember(obj, "protocolVersion");
    if (!version) {
        throwProtocol("initialize result missing protocolVersion");
    }
    out.protocolVersion = *version;
    if (const JSONValue* info = FindMember(obj, "serverInfo")) {
        if (const auto* infoObj = std::get_if<JSONValue::Object>(&info->value)) {
            out.serverInfo.name = GetStringMember(*infoObj, "name").value_or("");
            out.serverInfo.version = GetStringMember(*infoObj, "version").value_or("");
        }
    }
    if (const JSONValue* caps = FindMember(obj, "capabilities")) {
        out.capabilities = *caps;
    } else {
        out.capabilities = JSONValue{JSONValue::Object{}};
    }
    out.instructions = GetStringMember(obj, "instructions");
    if (out.protocolVersion != PROTOCOL_VERSION) {
        LOG_WARN("Server {} negotiated protocol version {} (requested {})", out.serverInfo.name, out.protocolVersion, PROTOCOL_VERSION);
    }

    co_await async::makeFutureAwaitable(
        transport->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized)));
    LOG_INFO("Initialized with server {} {}", out.serverInfo.name, out.serverInfo.version);
    co_return out;
}

async::Task<ListPage> Client::Impl::coListPage(std::string method, std::string key, std::optional<std::string> cursor) {
    std::optional<JSONValue> params;
    if (cursor.has_value()) {
        JSONValue::Object p;
        p["cursor"] = std::make_shared<JSONValue>(cursor.value());
        params = JSONValue{std::move(p)};
    }
    JSONValue result = co_await async::makeFutureAwaitable(coRequest(method, std::move(params)).toFuture());
    co_return parseListPage(result, method.c_str(), key.c_str());
}

async::Task<std::vector<JSONValue>> Client::Impl::coListAll(std::string method, std::string key) {
    FUNC_SCOPE();
    std::vector<JSONValue> all;
    std::set<std::string> seenCursors;
    std::optional<std::string> cursor;
    for (std::size_t pageNo = 0; pageNo < kMaxListPages; ++pageNo) {
        ListPage page = co_await async::makeFutureAwaitable(coListPage(method, key, cursor).toFuture());
        for (auto& item : page.items) {
            all.push_back(std::move(item));
        }
        if (!page.nextCursor.has_value()) {
            co_return all;
        }
        if (!seenCursors.insert(page.nextCursor.value()).second) {
            throwProtocol(std::format("{} returned a repeated cursor '{}'", method, page.nextCursor.value()));
        }
        cursor = page.nextCursor;
    }
    throwProtocol(std::format("{} exceeded {} pages", method, kMaxListPages));
}

Client::Client() : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
}

Client::~Client() {
    FUNC_SCOPE();
    if (pImpl->transport && pImpl->transport->IsConnected()) {
        pImpl->coDisconnect().toFuture().get();
    }
}

std::future<void> Client::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    return pImpl->coConnect(std::move(transport)).toFuture();
}

std::future<void> Client::Disconnect() {
    FUNC_SCOPE();
    return pImpl->coDisconnect().toFuture();
}

bool Client::IsConnected() const {
    return pImpl->transport ? pImpl->transport->IsConnected() : false;
}

std::future<InitializeResult> Client::Initialize(const Implementation& clientInfo) {
    FUNC_SCOPE();
    return pImpl->coInitialize(clientInfo).toFuture();
}

std::future<ListPage> Client::ListToolsPage(const std::optional<std::string>& cursor) {
    return pImpl->coListPage(Methods::ListTools, "tools", cursor).toFuture();
}

std::future<std::vector<JSONValue>> Client::ListTools() {
    return pImpl->coListAll(Methods::ListTools, "tools").toFuture();
}

std::future<ListPage> Client::ListResourcesPage(const std::optional<std::string>& cursor) {
    return pImpl->coListPage(Methods::ListResources, "resources", cursor).toFuture();
}

std::future<std::vector<JSONValue>> Client::ListResources() {
    return pImpl->coListAll(Methods::ListResources, "resources").toFuture();
}

std::future<JSONValue> Client::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(name);
    paramsObj["arguments"] = std::make_shared<JSONValue>(arguments);
    LOG_DEBUG("Calling tool: {}", name);
    return pImpl->coRequest(Methods::CallTool, JSONValue{std::move(paramsObj)}).toFuture();
}

std::future<JSONValue> Client::ReadResource(const std::string& uri) {
    FUNC_SCOPE();
    JSONValue::Object paramsObj;
    paramsObj["uri"] = std::make_shared<JSONValue>(uri);
    return pImpl->coRequest(Methods::ReadResource, JSONValue{std::move(paramsObj)}).toFuture();
}

std::future<void> Client::Ping() {
    return pImpl->coPing().toFuture();
}

void Client::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    if (handler) {
        pImpl->notificationHandlers[method] = std::move(handler);
    } else {
        pImpl->notificationHandlers.erase(method);
    }
}

void Client::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

std::unique_ptr<IClient> ClientFactory::CreateClient() {
    return std::make_unique<Client>();
}

} // namespace mcphost
