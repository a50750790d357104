/**
 * @file test_output_buffer.cpp
 * @brief Unit tests for bounded output capture.
 * @author Dimitris Kafetzis
 */

#include "executor/output_buffer.hpp"

#include <gtest/gtest.h>

using namespace exec_engine;

TEST(OutputBufferTest, UnboundedKeepsEverything) {
    OutputBuffer buffer;
    EXPECT_EQ(buffer.append("hello "), "hello ");
    EXPECT_EQ(buffer.append("world"), "world");
    EXPECT_EQ(buffer.str(), "hello world");
    EXPECT_FALSE(buffer.truncated());
    EXPECT_EQ(buffer.captured_bytes(), 11u);
}

TEST(OutputBufferTest, TruncatesAtLimitWithSingleMarker) {
    OutputBuffer buffer(8);
    EXPECT_EQ(buffer.append("12345"), "12345");
    EXPECT_EQ(buffer.append("67890"), std::string{"678"} + std::string{kTruncationMarker});
    EXPECT_EQ(buffer.append("more"), "");

    EXPECT_TRUE(buffer.truncated());
    EXPECT_EQ(buffer.str(), std::string{"12345678"} + std::string{kTruncationMarker});
    EXPECT_EQ(buffer.captured_bytes(), 8u);
    EXPECT_EQ(buffer.dropped_bytes(), 6u);
}

TEST(OutputBufferTest, ExactFitIsNotTruncated) {
    OutputBuffer buffer(4);
    buffer.append("abcd");
    EXPECT_FALSE(buffer.truncated());
    EXPECT_EQ(buffer.str(), "abcd");

    buffer.append("e");
    EXPECT_TRUE(buffer.truncated());
    EXPECT_EQ(buffer.dropped_bytes(), 1u);
}

TEST(OutputBufferTest, EmptyChunkIsNoop) {
    OutputBuffer buffer(4);
    EXPECT_EQ(buffer.append(""), "");
    EXPECT_TRUE(buffer.str().empty());
}

TEST(OutputBufferTest, TakeMovesContent) {
    OutputBuffer buffer;
    buffer.append("data");
    EXPECT_EQ(buffer.take(), "data");
}
