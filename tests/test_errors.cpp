//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: Tests for McpError mapping and the server lifecycle error hierarchy
//==========================================================================================================

#include <gtest/gtest.h>

#include <csignal>

#include "mcphost/errors/Errors.h"
#include "mcphost/server/ProcessHandle.h"
#include "mcphost/server/ServerErrors.h"

using namespace mcphost;
using namespace mcphost::errors;

TEST(ErrorsMapping, ErrorValueToMcpError) {
    JSONValue::Object err;
    err["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(JSONRPCErrorCodes::MethodNotFound));
    err["message"] = std::make_shared<JSONValue>(std::string("Method not found"));
    err["data"] = std::make_shared<JSONValue>(std::string("tools/list"));
    auto e = mcpErrorFromErrorValue(JSONValue{err});
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(e->message, "Method not found");
    EXPECT_EQ(e->category, ErrorCategory::JsonRpcMethodNotFound);
    ASSERT_TRUE(e->data.has_value());
    EXPECT_EQ(std::get<std::string>(e->data->value), "tools/list");
}

TEST(ErrorsMapping, NonObjectIsNotAnErrorValue) {
    EXPECT_FALSE(mcpErrorFromErrorValue(JSONValue{std::string("boom")}).has_value());
}

TEST(ErrorsMapping, CategoriesForLibraryCodes) {
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ConnectionError), ErrorCategory::Connection);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::ProtocolError), ErrorCategory::Protocol);
    EXPECT_EQ(errorCategoryFromCode(JSONRPCErrorCodes::RequestTimeout), ErrorCategory::Timeout);
    EXPECT_EQ(errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(ErrorsMapping, ThrowIfErrorRaisesTypedException) {
    auto resp = CreateErrorResponse(JSONRPCId{int64_t{7}}, JSONRPCErrorCodes::InvalidParams, "bad args");
    try {
        throwIfError(*resp);
        FAIL() << "expected McpException";
    } catch (const McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(e.category(), ErrorCategory::JsonRpcInvalidParams);
        EXPECT_STREQ(e.what(), "bad args");
    }
}

TEST(ErrorsMapping, MalformedErrorObjectBecomesInternalError) {
    JSONRPCResponse resp(JSONRPCId{int64_t{1}}, JSONValue{std::string("oops")}, true);
    try {
        throwIfError(resp);
        FAIL() << "expected McpException";
    } catch (const McpException& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::InternalError);
        EXPECT_STREQ(e.what(), "Malformed error response");
    }
}

TEST(ErrorsMapping, SuccessfulResponseDoesNotThrow) {
    JSONRPCResponse resp(JSONRPCId{int64_t{1}}, JSONValue{JSONValue::Object{}});
    EXPECT_NO_THROW(throwIfError(resp));
}

TEST(ServerErrors, MessagesNameTheServer) {
    LaunchError launch("fs", "Server startup timeout reached");
    EXPECT_STREQ(launch.what(), "Failed to launch server fs: Server startup timeout reached");
    EXPECT_EQ(launch.serverName(), "fs");
    EXPECT_FALSE(launch.exitCode().has_value());

    HealthError health("fs", "Process is not responding to signals");
    EXPECT_STREQ(health.what(), "Server fs health check failed: Process is not responding to signals");
}

TEST(ServerErrors, ExitErrorFormatsCodeAndSignal) {
    ExitError byCode("git", 2, std::nullopt);
    EXPECT_STREQ(byCode.what(), "Server git exited with code 2 (signal: null)");
    EXPECT_EQ(byCode.exitCode().value(), 2);

    ExitError bySignal("git", std::nullopt, SIGKILL);
    EXPECT_STREQ(bySignal.what(), "Server git exited with code null (signal: SIGKILL)");
    EXPECT_EQ(bySignal.signal().value(), SIGKILL);

    const ServerError& base = bySignal;
    EXPECT_EQ(base.serverName(), "git");
}

TEST(ServerErrors, DiscoveryErrorKeepsCauses) {
    auto cause = std::make_exception_ptr(std::runtime_error("No capabilities discovered"));
    DiscoveryError single("No capabilities discovered", {cause}, std::string("empty"));
    ASSERT_EQ(single.causes().size(), 1u);
    EXPECT_EQ(DescribeException(single.causes().front()), "No capabilities discovered");
    EXPECT_EQ(single.serverName().value(), "empty");

    DiscoveryError aggregate("One or more servers failed capability discovery", {cause, cause});
    EXPECT_EQ(aggregate.causes().size(), 2u);
    EXPECT_FALSE(aggregate.serverName().has_value());
}

TEST(ServerErrors, SignalNames) {
    EXPECT_EQ(SignalName(std::nullopt), "null");
    EXPECT_EQ(SignalName(SIGTERM), "SIGTERM");
    EXPECT_EQ(SignalName(SIGSEGV), "SIGSEGV");
}
