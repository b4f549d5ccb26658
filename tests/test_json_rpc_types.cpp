//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_rpc_types.cpp
// Purpose: JSON parser/serializer and JSON-RPC message tests
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

using namespace mcphost;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":-7}})");
    ASSERT_TRUE(v.isObject());
    const auto& obj = std::get<JSONValue::Object>(v.value);
    const JSONValue* a = FindMember(obj, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(arr[3]->value));
    EXPECT_TRUE(arr[4]->isNull());
    const JSONValue* b = FindMember(obj, "b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(GetIntMember(std::get<JSONValue::Object>(b->value), "c").value(), -7);
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("line\nquote\" \u00e9 \ud83d\ude00")");
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(std::get<std::string>(v.value), "line\nquote\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,2"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONParser, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep.append(300, ']');
    EXPECT_THROW(ParseJSON(deep), std::runtime_error);
}

TEST(JSONSerializer, EscapesControlCharacters) {
    JSONValue v{std::string("a\"b\\c\n\x01")};
    EXPECT_EQ(SerializeJSON(v), "\"a\\\"b\\\\c\\n\\u0001\"");
}

TEST(JSONRPCMessages, RequestSerializesAndParsesBack) {
    JSONValue::Object params;
    params["cursor"] = std::make_shared<JSONValue>(std::string("page-2"));
    JSONRPCRequest req(JSONRPCId{int64_t{42}}, "tools/list", JSONValue{params});
    JSONRPCRequest parsed;
    ASSERT_TRUE(parsed.Deserialize(req.Serialize()));
    EXPECT_EQ(std::get<int64_t>(parsed.id), 42);
    EXPECT_EQ(parsed.method, "tools/list");
    ASSERT_TRUE(parsed.params.has_value());
    EXPECT_EQ(GetStringMember(std::get<JSONValue::Object>(parsed.params->value), "cursor").value(), "page-2");
}

TEST(JSONRPCMessages, RequestWithoutIdIsRejected) {
    JSONRPCRequest req;
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","method":"ping"})"));
}

TEST(JSONRPCMessages, ResponseNeedsResultOrError) {
    JSONRPCResponse resp;
    EXPECT_FALSE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    ASSERT_TRUE(resp.Deserialize(R"({"jsonrpc":"2.0","error":{"code":-32700,"message":"Parse error"}})"));
    EXPECT_TRUE(resp.IsError());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(resp.id));
}

TEST(JSONRPCMessages, ClassifiesByTopLevelMembers) {
    EXPECT_EQ(ClassifyMessage(R"({"jsonrpc":"2.0","id":"1","method":"ping"})"), MessageKind::Request);
    EXPECT_EQ(ClassifyMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"), MessageKind::Notification);
    EXPECT_EQ(ClassifyMessage(R"({"jsonrpc":"2.0","id":"1","result":{}})"), MessageKind::Response);
    EXPECT_EQ(ClassifyMessage(R"({"jsonrpc":"2.0","id":"1"})"), MessageKind::Unknown);
    EXPECT_EQ(ClassifyMessage("not json"), MessageKind::Unknown);
}

TEST(JSONRPCMessages, ErrorResponseCarriesCodeAndData) {
    auto resp = CreateErrorResponse(JSONRPCId{std::string("r1")}, JSONRPCErrorCodes::InvalidParams, "bad",
                                    JSONValue{std::string("detail")});
    ASSERT_TRUE(resp->IsError());
    const auto& err = std::get<JSONValue::Object>(resp->error->value);
    EXPECT_EQ(GetIntMember(err, "code").value(), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetStringMember(err, "message").value(), "bad");
    EXPECT_EQ(GetStringMember(err, "data").value(), "detail");
    EXPECT_EQ(IdToString(resp->id), "r1");
}
