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


#include <gtest/gtest.h>

#include <array>
#include <atomic>
#include <chrono>
#include <thread>

#include <utils/thread_pool.hpp>

using namespace std::chrono_literals;

namespace {
void WaitForDrain(pgfence::utils::ThreadPool const &pool) {
  while (pool.UnfinishedTasksNum() != 0) {
    std::this_thread::sleep_for(10ms);
  }
}
}  // namespace

TEST(ThreadPool, Basic) {
  static constexpr size_t adder_count = 100000;
  static constexpr std::array<size_t, 4> pool_sizes{1, 2, 4, 16};

  for (const auto pool_size : pool_sizes) {
    pgfence::utils::ThreadPool pool{pool_size};

    std::atomic<size_t> count{0};
    for (size_t i = 0; i < adder_count; ++i) {
      pool.AddTask([&] { count.fetch_add(1); });
    }

    WaitForDrain(pool);
    ASSERT_EQ(count.load(), adder_count);
  }
}

TEST(ThreadPool, TasksAddedByTasks) {
  pgfence::utils::ThreadPool pool{2, "nested"};

  std::atomic<int> count{0};
  for (int i = 0; i < 100; ++i) {
    pool.AddTask([&] {
      count.fetch_add(1);
      pool.AddTask([&] { count.fetch_add(1); });
    });
  }

  WaitForDrain(pool);
  ASSERT_EQ(count.load(), 200);
}

TEST(ThreadPool, ShutDownDropsQueuedTasks) {
  pgfence::utils::ThreadPool pool{1};

  std::atomic<bool> started{false};
  std::atomic<bool> release{false};
  std::atomic<int> count{0};
  pool.AddTask([&] {
    started = true;
    while (!release) std::this_thread::sleep_for(1ms);
    count.fetch_add(1);
  });
  for (int i = 0; i < 10; ++i) {
    pool.AddTask([&] { count.fetch_add(1); });
  }
  EXPECT_EQ(pool.UnfinishedTasksNum(), 11);
  while (!started) std::this_thread::sleep_for(1ms);

  std::thread releaser([&] {
    std::this_thread::sleep_for(50ms);
    release = true;
  });
  pool.ShutDown();
  releaser.join();

  // The running task finishes, queued ones never start.
  EXPECT_EQ(count.load(), 1);
  EXPECT_EQ(pool.UnfinishedTasksNum(), 0);

  pool.AddTask([&] { count.fetch_add(1); });
  EXPECT_EQ(pool.UnfinishedTasksNum(), 0);
}

TEST(ThreadPool, LongNameIsTruncated) {
  pgfence::utils::ThreadPool pool{1, "a_very_long_thread_pool_name"};
  std::atomic<bool> done{false};
  pool.AddTask([&] { done = true; });
  WaitForDrain(pool);
  EXPECT_TRUE(done);
}
