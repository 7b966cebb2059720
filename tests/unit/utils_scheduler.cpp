// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.


#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include "utils/scheduler.hpp"

using namespace std::chrono_literals;

/**
 * Scheduler runs every 500ms and increases the variable; the test thread
 * checks it between executions.
 */
TEST(Scheduler, TestFunctionExecuting) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  pgfence::utils::Scheduler scheduler;
  scheduler.Run("Test", 500ms, func);

  EXPECT_EQ(x, 0);
  std::this_thread::sleep_for(400ms);
  EXPECT_EQ(x, 0);

  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(x, 1);

  std::this_thread::sleep_for(1000ms);
  EXPECT_EQ(x, 3);

  std::this_thread::sleep_for(50ms);
  scheduler.Stop();
  EXPECT_EQ(x, 3);
}

TEST(Scheduler, SpinOnce) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  pgfence::utils::Scheduler scheduler;
  scheduler.Run("Test", 100s, func);

  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(x, 0);

  scheduler.SpinOnce();
  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(x, 1);
}

TEST(Scheduler, PauseResume) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  pgfence::utils::Scheduler scheduler;
  scheduler.Run("Test", 100ms, func);

  scheduler.Pause();
  std::this_thread::sleep_for(350ms);
  const auto x_paused = x.load();
  std::this_thread::sleep_for(350ms);
  EXPECT_LE(x, x_paused + 1);

  scheduler.Resume();
  std::this_thread::sleep_for(350ms);
  EXPECT_GT(x, x_paused + 1);
}

TEST(Scheduler, IsRunningFalse) {
  pgfence::utils::Scheduler scheduler;
  EXPECT_FALSE(scheduler.IsRunning());
}

TEST(Scheduler, StopIdleScheduler) {
  pgfence::utils::Scheduler scheduler;
  ASSERT_NO_THROW(scheduler.Stop());
}

TEST(Scheduler, RunStop) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  pgfence::utils::Scheduler scheduler;
  scheduler.Run("Test", 100ms, func);
  EXPECT_TRUE(scheduler.IsRunning());
  scheduler.Stop();
  EXPECT_FALSE(scheduler.IsRunning());
}

TEST(Scheduler, StopStoppedScheduler) {
  std::atomic<int> x{0};
  std::function<void()> func{[&x]() { ++x; }};
  pgfence::utils::Scheduler scheduler;
  scheduler.Run("Test", 100ms, func);
  ASSERT_NO_THROW({
    scheduler.Stop();
    scheduler.Stop();
  });
}
