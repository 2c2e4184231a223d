/**
 * @file test_completion_tracker.cpp
 * @brief Unit tests for the success counter and worker barrier
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_copy/engine/completion_tracker.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace kcenon::bulk_copy::test {

class CompletionTrackerTest : public ::testing::Test {};

TEST_F(CompletionTrackerTest, StartsEmpty) {
    completion_tracker tracker;
    EXPECT_EQ(tracker.value(), 0u);
    EXPECT_EQ(tracker.outstanding(), 0u);
    EXPECT_TRUE(tracker.wait_for(std::chrono::milliseconds(1)));
}

TEST_F(CompletionTrackerTest, RecordSuccessReturnsNewCount) {
    completion_tracker tracker;
    EXPECT_EQ(tracker.record_success(), 1u);
    EXPECT_EQ(tracker.record_success(), 2u);
    EXPECT_EQ(tracker.value(), 2u);
}

TEST_F(CompletionTrackerTest, ConcurrentIncrementsAreNotLost) {
    completion_tracker tracker;
    constexpr int threads = 8;
    constexpr int per_thread = 1000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < per_thread; ++i) {
                tracker.record_success();
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(tracker.value(), static_cast<std::size_t>(threads * per_thread));
}

TEST_F(CompletionTrackerTest, WaitBlocksUntilAllDone) {
    completion_tracker tracker;
    tracker.add(3);
    EXPECT_EQ(tracker.outstanding(), 3u);

    tracker.done();
    tracker.done();
    EXPECT_FALSE(tracker.wait_for(std::chrono::milliseconds(20)));

    std::thread last([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        tracker.done();
    });

    tracker.wait_all();
    EXPECT_EQ(tracker.outstanding(), 0u);
    last.join();
}

TEST_F(CompletionTrackerTest, CountIsIndependentOfBarrier) {
    completion_tracker tracker;
    tracker.add(1);
    tracker.record_success();
    tracker.record_success();
    EXPECT_EQ(tracker.outstanding(), 1u);
    tracker.done();
    tracker.wait_all();
    EXPECT_EQ(tracker.value(), 2u);
}

TEST_F(CompletionTrackerTest, WorkerGuardSignalsOnScopeExit) {
    completion_tracker tracker;
    tracker.add(2);

    std::vector<std::thread> workers;
    for (int i = 0; i < 2; ++i) {
        workers.emplace_back([&]() {
            completion_tracker::worker_guard guard(tracker);
            tracker.record_success();
        });
    }

    tracker.wait_all();
    EXPECT_EQ(tracker.value(), 2u);
    for (auto& w : workers) {
        w.join();
    }
}

TEST_F(CompletionTrackerTest, ExtraDoneDoesNotUnderflow) {
    completion_tracker tracker;
    tracker.done();
    EXPECT_EQ(tracker.outstanding(), 0u);
}

}  // namespace kcenon::bulk_copy::test
