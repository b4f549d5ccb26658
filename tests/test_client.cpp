//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: Protocol client tests against a scripted in-memory server
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "mcphost/Client.h"
#include "mcphost/InMemoryTransport.hpp"
#include "mcphost/errors/Errors.h"

using namespace mcphost;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<JSONRPCResponse> reply(const JSONRPCRequest& req, const std::string& resultJson) {
    return std::make_unique<JSONRPCResponse>(req.id, ParseJSON(resultJson));
}

std::optional<std::string> cursorOf(const JSONRPCRequest& req) {
    if (!req.params.has_value() || !req.params->isObject()) {
        return std::nullopt;
    }
    return GetStringMember(std::get<JSONValue::Object>(req.params->value), "cursor");
}

// Client connected to a scripted peer. The peer transport lives as long as the fixture.
class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto [clientSide, serverSide] = InMemoryTransport::CreatePair();
        server = std::move(serverSide);
        server->SetRequestHandler([this](const JSONRPCRequest& req) {
            {
                std::lock_guard<std::mutex> lk(mu);
                methods.push_back(req.method);
            }
            return handler(req);
        });
        server->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
            std::lock_guard<std::mutex> lk(mu);
            notifications.push_back(n->method);
        });
        server->Start().get();
        client = std::make_unique<Client>();
        client->Connect(std::move(clientSide)).get();
    }

    void TearDown() override {
        client->Disconnect().get();
        server->Close().get();
    }

    std::vector<std::string> receivedNotifications() {
        std::lock_guard<std::mutex> lk(mu);
        return notifications;
    }

    std::unique_ptr<InMemoryTransport> server;
    std::unique_ptr<Client> client;
    std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)> handler;
    std::mutex mu;
    std::vector<std::string> methods;
    std::vector<std::string> notifications;
};

} // namespace

TEST_F(ClientTest, InitializeParsesResultAndSendsInitialized) {
    handler = [](const JSONRPCRequest& req) {
        return reply(req, R"({"protocolVersion":"2024-11-05","serverInfo":{"name":"fs","version":"2.1"},)"
                          R"("capabilities":{"tools":{}},"instructions":"be nice"})");
    };
    auto init = client->Initialize(Implementation("mcphost", "0.1.0")).get();
    EXPECT_EQ(init.protocolVersion, "2024-11-05");
    EXPECT_EQ(init.serverInfo.name, "fs");
    EXPECT_EQ(init.serverInfo.version, "2.1");
    EXPECT_TRUE(init.capabilities.isObject());
    EXPECT_EQ(init.instructions.value(), "be nice");

    for (int i = 0; i < 100 && receivedNotifications().empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(receivedNotifications().size(), 1u);
    EXPECT_EQ(receivedNotifications().front(), "notifications/initialized");
}

TEST_F(ClientTest, InitializeWithoutProtocolVersionIsProtocolError) {
    handler = [](const JSONRPCRequest& req) { return reply(req, R"({"serverInfo":{"name":"x","version":"1"}})"); };
    try {
        client->Initialize(Implementation("mcphost", "0.1.0")).get();
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ProtocolError);
    }
}

TEST_F(ClientTest, ListToolsFollowsCursors) {
    handler = [](const JSONRPCRequest& req) {
        auto cursor = cursorOf(req);
        if (!cursor) {
            return reply(req, R"({"tools":[{"name":"a"},{"name":"b"}],"nextCursor":"p2"})");
        }
        if (*cursor == "p2") {
            return reply(req, R"({"tools":[{"name":"c"}],"nextCursor":"p3"})");
        }
        return reply(req, R"({"tools":[{"name":"d"}]})");
    };
    auto tools = client->ListTools().get();
    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(GetStringMember(std::get<JSONValue::Object>(tools[3].value), "name").value(), "d");
    EXPECT_EQ(methods.size(), 3u);
}

TEST_F(ClientTest, ListToolsPageReturnsCursor) {
    handler = [](const JSONRPCRequest& req) { return reply(req, R"({"tools":[],"nextCursor":"next"})"); };
    auto page = client->ListToolsPage(std::nullopt).get();
    EXPECT_TRUE(page.items.empty());
    EXPECT_EQ(page.nextCursor.value(), "next");
}

TEST_F(ClientTest, RepeatedCursorStopsPagination) {
    handler = [](const JSONRPCRequest& req) { return reply(req, R"({"resources":[{"uri":"file:///a"}],"nextCursor":"same"})"); };
    try {
        client->ListResources().get();
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ProtocolError);
        EXPECT_NE(std::string(e.what()).find("repeated cursor 'same'"), std::string::npos);
    }
}

TEST_F(ClientTest, ListResultWithoutArrayIsProtocolError) {
    handler = [](const JSONRPCRequest& req) { return reply(req, R"({"tools":"nope"})"); };
    EXPECT_THROW(client->ListTools().get(), errors::McpException);
}

TEST_F(ClientTest, ServerErrorIsRaisedWithItsCode) {
    handler = [](const JSONRPCRequest& req) {
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found");
    };
    try {
        client->ListResources().get();
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::JsonRpcMethodNotFound);
    }
}

TEST_F(ClientTest, CallToolForwardsNameAndArguments) {
    handler = [](const JSONRPCRequest& req) {
        const auto& params = std::get<JSONValue::Object>(req.params->value);
        const JSONValue* args = FindMember(params, "arguments");
        std::string text = GetStringMember(params, "name").value() + ":" +
                           GetStringMember(std::get<JSONValue::Object>(args->value), "path").value();
        JSONValue::Object result;
        result["text"] = std::make_shared<JSONValue>(text);
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{result});
    };
    JSONValue::Object args;
    args["path"] = std::make_shared<JSONValue>(std::string("/tmp"));
    auto result = client->CallTool("list_dir", JSONValue{args}).get();
    EXPECT_EQ(GetStringMember(std::get<JSONValue::Object>(result.value), "text").value(), "list_dir:/tmp");
}

TEST_F(ClientTest, ReadResourceSendsUri) {
    handler = [](const JSONRPCRequest& req) {
        auto uri = GetStringMember(std::get<JSONValue::Object>(req.params->value), "uri").value();
        return reply(req, R"({"contents":[{"uri":")" + uri + R"(","text":"hello"}]})");
    };
    auto result = client->ReadResource("file:///a.txt").get();
    EXPECT_TRUE(result.isObject());
}

TEST_F(ClientTest, PingSucceeds) {
    handler = [](const JSONRPCRequest& req) { return reply(req, "{}"); };
    EXPECT_NO_THROW(client->Ping().get());
    EXPECT_EQ(methods.back(), "ping");
}

TEST_F(ClientTest, NotificationHandlerReceivesServerNotifications) {
    std::promise<std::string> got;
    client->SetNotificationHandler("notifications/tools/list_changed",
                                   [&got](const std::string& method, const JSONValue&) { got.set_value(method); });
    server->SendNotification(std::make_unique<JSONRPCNotification>("notifications/tools/list_changed")).get();
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "notifications/tools/list_changed");
}

TEST_F(ClientTest, RequestsFailAfterDisconnect) {
    client->Disconnect().get();
    EXPECT_FALSE(client->IsConnected());
    try {
        client->Ping().get();
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::Connection);
    }
}

TEST(ClientStandalone, ConnectWithNullTransportFails) {
    Client client;
    EXPECT_THROW(client.Connect(nullptr).get(), std::invalid_argument);
    EXPECT_FALSE(client.IsConnected());
}
