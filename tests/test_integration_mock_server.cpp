//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_integration_mock_server.cpp
// Purpose: Launcher, discovery and pool end to end against the mock stdio tool server
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "mcphost/server/ServerPool.h"

using namespace mcphost;
using namespace std::chrono_literals;

namespace {

ServerConfig mockServer(std::vector<std::string> args = {}) {
    return ServerConfig{MCPHOST_MOCK_SERVER_PATH, std::move(args), std::nullopt};
}

LauncherOptions testOptions() {
    LauncherOptions o;
    o.launchTimeout = 5000ms;
    o.healthInterval = 50ms;
    o.stopTimeout = 1000ms;
    return o;
}

} // namespace

TEST(MockServerIntegration, LaunchAndDiscover) {
    ServerLauncher launcher(testOptions());
    ServerDiscovery discovery;

    auto process = launcher.Launch("mock", mockServer()).get();
    ASSERT_NE(process, nullptr);
    EXPECT_GT(process->pid, 0);

    auto server = discovery.DiscoverCapabilities("mock", process).get();
    ASSERT_EQ(server.capabilities.tools.size(), 1u);
    EXPECT_EQ(server.capabilities.tools[0].name, "mockTool");
    EXPECT_TRUE(server.capabilities.resources.empty());
    const auto& schema = std::get<JSONValue::Object>(server.capabilities.tools[0].inputSchema.value);
    EXPECT_EQ(GetStringMember(schema, "type").value(), "object");

    JSONValue::Object args;
    args["input"] = std::make_shared<JSONValue>(std::string("hello"));
    auto result = server.client->CallTool("mockTool", JSONValue{args}).get();
    const auto& content = std::get<JSONValue::Array>(FindMember(std::get<JSONValue::Object>(result.value), "content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(GetStringMember(std::get<JSONValue::Object>(content[0]->value), "text").value(), "mock result: hello");
    EXPECT_NO_THROW(server.client->Ping().get());

    server.client->Disconnect().get();
    launcher.Stop("mock").get();
    EXPECT_EQ(launcher.GetProcess("mock"), nullptr);
}

TEST(MockServerIntegration, ServerWithoutCapabilitiesFailsDiscovery) {
    ServerLauncher launcher(testOptions());
    ServerDiscovery discovery;
    auto process = launcher.Launch("bare", mockServer({"--no-capabilities"})).get();
    try {
        discovery.DiscoverCapabilities("bare", process).get();
        FAIL() << "expected DiscoveryError";
    } catch (const DiscoveryError& e) {
        EXPECT_STREQ(e.what(), "No capabilities discovered");
    }
}

TEST(MockServerIntegration, MissingMarkerTimesOut) {
    auto options = testOptions();
    options.launchTimeout = 300ms;
    ServerLauncher launcher(options);
    EXPECT_THROW(launcher.Launch("silent", mockServer({"--no-marker"})).get(), LaunchError);
    EXPECT_EQ(launcher.GetProcess("silent"), nullptr);
}

TEST(MockServerIntegration, PoolSharesAndReleasesServer) {
    auto launcher = std::make_shared<ServerLauncher>(testOptions());
    auto discovery = std::make_shared<ServerDiscovery>();
    ServerPool pool(launcher, discovery);

    auto first = pool.GetOrCreateServer("mock", mockServer()).get();
    auto second = pool.GetOrCreateServer("mock", mockServer()).get();
    EXPECT_EQ(first.client, second.client);
    auto process = launcher->GetProcess("mock");
    ASSERT_NE(process, nullptr);

    pool.RegisterSessionServer("session-1", "mock");
    pool.ReleaseSessionServers("session-1");
    EXPECT_FALSE(pool.HasServer("mock"));
    EXPECT_EQ(launcher->GetProcess("mock"), nullptr);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!process->HasExited() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_TRUE(process->HasExited());
}

TEST(MockServerIntegration, CrashedServerIsEvictedFromPool) {
    auto launcher = std::make_shared<ServerLauncher>(testOptions());
    auto discovery = std::make_shared<ServerDiscovery>();
    ServerPool pool(launcher, discovery);

    pool.GetOrCreateServer("crashy", mockServer({"--exit-after-ms", "700"})).get();
    pool.RegisterSessionServer("session-1", "crashy");
    EXPECT_TRUE(pool.HasServer("crashy"));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (pool.HasServer("crashy") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_FALSE(pool.HasServer("crashy"));
    EXPECT_TRUE(pool.GetSessionServers("session-1").empty());
    EXPECT_EQ(launcher->GetProcess("crashy"), nullptr);
}
