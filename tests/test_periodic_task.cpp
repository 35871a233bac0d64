/**
 * BSD 3-Clause License
 * Copyright (c) 2021-2025, kcenon
 *
 * Periodic Task Tests
 */

#include <gtest/gtest.h>
#include <watchtower/core/periodic_task.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace watchtower;
using namespace std::chrono_literals;

TEST(PeriodicTaskTest, RejectsInvalidConstruction) {
    EXPECT_THROW(periodic_task("t", 0ms, [] {}), std::invalid_argument);
    EXPECT_THROW(periodic_task("t", 10ms, nullptr), std::invalid_argument);
}

TEST(PeriodicTaskTest, RunsRepeatedlyUntilStopped) {
    std::atomic<int> runs{0};
    periodic_task task("counter", 5ms, [&runs] { ++runs; });

    ASSERT_TRUE(task.start().is_ok());
    EXPECT_TRUE(task.is_running());

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(task.stop().is_ok());
    EXPECT_FALSE(task.is_running());
    EXPECT_GE(runs.load(), 3);

    const int after_stop = runs.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(runs.load(), after_stop);
}

TEST(PeriodicTaskTest, DoubleStartRejected) {
    periodic_task task("idle", 1h, [] {});
    ASSERT_TRUE(task.start().is_ok());
    auto again = task.start();
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(code_of(again.error()), error_code::already_started);
    EXPECT_TRUE(task.stop().is_ok());
}

TEST(PeriodicTaskTest, StopInterruptsLongInterval) {
    periodic_task task("slow", 1h, [] {});
    ASSERT_TRUE(task.start().is_ok());

    const auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(task.stop().is_ok());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    EXPECT_EQ(task.run_count(), 0u);
}

TEST(PeriodicTaskTest, ThrowingBodyKeepsLoopAlive) {
    std::atomic<int> runs{0};
    periodic_task task("flaky", 5ms, [&runs] {
        ++runs;
        throw std::runtime_error("boom");
    });

    ASSERT_TRUE(task.start().is_ok());
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (runs.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(task.stop().is_ok());
    EXPECT_GE(runs.load(), 2);
}
