//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the newline and Content-Length framers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcphost/ContentFramer.h"

using mcphost::IContentFramer;

TEST(NewlineFramerTest, EncodeAppendsNewline) {
    auto framer = mcphost::MakeNewlineFramer();
    EXPECT_EQ(framer->encode("{}"), "{}\n");
}

TEST(NewlineFramerTest, DecodesConsecutiveFramesAndKeepsRemainder) {
    auto framer = mcphost::MakeNewlineFramer();
    std::string buffer = "{\"a\":1}\r\n\n{\"b\":2}\n{\"c\"";
    auto first = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), "{\"a\":1}");
    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), "{\"b\":2}");
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "{\"c\"");
}

TEST(NewlineFramerTest, IncompleteDropsOnlyBlankLines) {
    auto framer = mcphost::MakeNewlineFramer();
    std::string buffer = "\n\n{\"partial\"";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 2u);
}

TEST(NewlineFramerTest, OverlongLineIsRejected) {
    auto framer = mcphost::MakeNewlineFramer(8);
    std::string buffer = "0123456789\n{}\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, 11u);
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    auto next = framer->tryDecode(buffer);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), "{}");
}

TEST(ContentLengthFramerTest, EncodeProducesExpectedHeader) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->encode("{}"), std::string("Content-Length: 2\r\n\r\n{}"));
}

TEST(ContentLengthFramerTest, TryDecodeExOkAtBoundary) {
    auto framer = mcphost::MakeContentLengthFramer(4);
    const std::string payload = "abcd";
    std::string buffer = std::string("Content-Length: 4\r\n\r\n") + payload;
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), payload);
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramerTest, BodyTooLargeAboveBoundary) {
    auto framer = mcphost::MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 5\r\n\r\nabcde";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_GT(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, HeaderNameIsCaseInsensitive) {
    auto framer = mcphost::MakeContentLengthFramer();
    std::string buffer = "content-length: 2\r\nX-Other: y\r\n\r\n{}";
    auto out = framer->tryDecode(buffer);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value(), "{}");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramerTest, MissingOrInvalidLengthIsInvalidHeader) {
    auto framer = mcphost::MakeContentLengthFramer();
    EXPECT_EQ(framer->tryDecodeEx("X-Other: y\r\n\r\n{}").status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: abc\r\n\r\n{}").status, IContentFramer::DecodeStatus::InvalidHeader);
}

TEST(ContentLengthFramerTest, WaitsForFullBody) {
    auto framer = mcphost::MakeContentLengthFramer();
    auto ex = framer->tryDecodeEx("Content-Length: 10\r\n\r\n{\"a\"");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
}
