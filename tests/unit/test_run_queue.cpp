/**
 * @file test_run_queue.cpp
 * @brief Unit tests for the per-project FIFO run queue.
 * @author Dimitris Kafetzis
 */

#include "scheduler/run_queue.hpp"

#include <gtest/gtest.h>

using namespace exec_engine;

// ─── Ordering ───────────────────────────────

TEST(RunQueueTest, EmptyQueueHasNothingReady) {
    RunQueue queue;
    EXPECT_FALSE(queue.has_ready());
    EXPECT_FALSE(queue.claim_next().has_value());
}

TEST(RunQueueTest, ClaimsInSubmissionOrderAcrossProjects) {
    RunQueue queue;
    queue.enqueue("e1", "p1");
    queue.enqueue("e2", "p2");
    queue.enqueue("e3", "p3");

    EXPECT_EQ(queue.claim_next()->id, "e1");
    EXPECT_EQ(queue.claim_next()->id, "e2");
    EXPECT_EQ(queue.claim_next()->id, "e3");
    EXPECT_EQ(queue.running_count(), 3u);
}

TEST(RunQueueTest, SingleFlightPerProject) {
    RunQueue queue;
    queue.enqueue("a1", "A");
    queue.enqueue("a2", "A");
    queue.enqueue("b1", "B");

    auto first = queue.claim_next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, "a1");

    // a2 is older than b1 but its project is busy
    auto second = queue.claim_next();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->id, "b1");

    EXPECT_FALSE(queue.claim_next().has_value());
    EXPECT_EQ(queue.queued_count("A"), 1u);

    queue.release("A");
    auto third = queue.claim_next();
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->id, "a2");
}

TEST(RunQueueTest, ReleasedProjectKeepsItsPlaceByAge) {
    RunQueue queue;
    queue.enqueue("a1", "A");
    queue.enqueue("a2", "A");
    queue.enqueue("b1", "B");
    queue.enqueue("c1", "C");

    ASSERT_EQ(queue.claim_next()->id, "a1");
    queue.release("A");

    // a2 (sequence 1) is older than b1 (2) and c1 (3)
    EXPECT_EQ(queue.claim_next()->id, "a2");
    EXPECT_EQ(queue.claim_next()->id, "b1");
    EXPECT_EQ(queue.claim_next()->id, "c1");
}

TEST(RunQueueTest, SequencesIncrease) {
    RunQueue queue;
    queue.enqueue("e1", "p1");
    queue.enqueue("e2", "p2");
    auto first = queue.claim_next();
    auto second = queue.claim_next();
    EXPECT_LT(first->sequence, second->sequence);
}

// ─── Removal ────────────────────────────────

TEST(RunQueueTest, RemoveHeadPromotesNext) {
    RunQueue queue;
    queue.enqueue("a1", "A");
    queue.enqueue("a2", "A");

    EXPECT_TRUE(queue.remove("a1"));
    EXPECT_FALSE(queue.contains("a1"));
    EXPECT_EQ(queue.claim_next()->id, "a2");
}

TEST(RunQueueTest, RemoveWhileProjectRunning) {
    RunQueue queue;
    queue.enqueue("a1", "A");
    queue.enqueue("a2", "A");
    ASSERT_EQ(queue.claim_next()->id, "a1");

    EXPECT_TRUE(queue.remove("a2"));
    EXPECT_FALSE(queue.remove("a2"));
    EXPECT_FALSE(queue.remove("a1"));   // running, not queued

    queue.release("A");
    EXPECT_FALSE(queue.has_ready());
    EXPECT_EQ(queue.queued_count(), 0u);
    EXPECT_EQ(queue.running_count(), 0u);
}

TEST(RunQueueTest, ReleaseUnknownProjectIsNoop) {
    RunQueue queue;
    queue.release("ghost");
    EXPECT_EQ(queue.running_count(), 0u);
}
