/**
 * @file test_types.cpp
 * @brief Unit tests for core identifiers, enums and records.
 * @author Dimitris Kafetzis
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace exec_engine;

// ─── Identifiers ────────────────────────────

TEST(TypesTest, GeneratedIdsAreVersion4) {
    auto id = generate_id();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_NE(std::string{"89ab"}.find(id[19]), std::string::npos);
}

TEST(TypesTest, GeneratedIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(generate_id());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

// ─── Language ───────────────────────────────

TEST(TypesTest, LanguageRoundTrip) {
    for (auto language : {Language::Python, Language::JavaScript, Language::Ruby}) {
        auto parsed = parse_language(to_string(language));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, language);
    }
}

TEST(TypesTest, UnknownLanguageRejected) {
    auto parsed = parse_language("cobol");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().kind, ErrorKind::InvalidArgument);
    EXPECT_FALSE(parse_language("Python").has_value());
}

// ─── Execution Status ───────────────────────

TEST(TypesTest, StatusColumnValues) {
    EXPECT_EQ(to_string(ExecutionStatus::Queued), "QUEUED");
    EXPECT_EQ(to_string(ExecutionStatus::Running), "RUNNING");
    EXPECT_EQ(to_string(ExecutionStatus::Completed), "COMPLETED");
    EXPECT_EQ(to_string(ExecutionStatus::Error), "ERROR");
    EXPECT_EQ(*parse_execution_status("RUNNING"), ExecutionStatus::Running);
    EXPECT_FALSE(parse_execution_status("running").has_value());
    EXPECT_FALSE(parse_execution_status("CANCELLED").has_value());
}

TEST(TypesTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(ExecutionStatus::Queued));
    EXPECT_FALSE(is_terminal(ExecutionStatus::Running));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Completed));
    EXPECT_TRUE(is_terminal(ExecutionStatus::Error));

    ExecutionRecord record;
    EXPECT_FALSE(record.terminal());
    record.status = ExecutionStatus::Error;
    EXPECT_TRUE(record.terminal());
}

// ─── Usage ──────────────────────────────────

TEST(TypesTest, UsageConversions) {
    UsageSnapshot usage;
    usage.cpu_time = Duration{1'500'000};
    usage.peak_memory_bytes = 3 * 1024 * 1024;
    EXPECT_DOUBLE_EQ(usage.cpu_seconds(), 1.5);
    EXPECT_DOUBLE_EQ(usage.peak_memory_mb(), 3.0);
}
