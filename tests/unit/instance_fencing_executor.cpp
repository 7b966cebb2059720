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


#include <chrono>

#include <gtest/gtest.h>

#include "fencing/exceptions.hpp"
#include "fencing/instance_fencing_executor.hpp"
#include "tests/unit/fencing_test_utils.hpp"

using namespace std::chrono_literals;
using pgfence::fencing::ClusterRole;
using pgfence::fencing::ExecutionError;
using pgfence::fencing::ExecutorConfig;
using pgfence::fencing::InstanceFencingExecutor;
using pgfence::fencing::test::SimulatedCluster;
using pgfence::fencing::test::WaitFor;

class InstanceFencingExecutorTest : public ::testing::Test {
 protected:
  SimulatedCluster cluster_{{"pg-1", "pg-2", "pg-3"}};
  InstanceFencingExecutor executor_{cluster_, cluster_, ExecutorConfig{.timeout = 200ms}};
};

TEST_F(InstanceFencingExecutorTest, FencedInstanceRefusesConnections) {
  ASSERT_TRUE(cluster_.TryConnect("pg-2"));
  executor_.Fence("pg-2");
  EXPECT_FALSE(cluster_.TryConnect("pg-2"));
  EXPECT_TRUE(cluster_.TryConnect("pg-1"));
  EXPECT_TRUE(cluster_.TryConnect("pg-3"));
}

TEST_F(InstanceFencingExecutorTest, FenceIsIdempotent) {
  executor_.Fence("pg-1");
  executor_.Fence("pg-1");
  EXPECT_FALSE(cluster_.TryConnect("pg-1"));
  EXPECT_EQ(cluster_.Snapshot("pg-1").stop_calls, 2);
}

TEST_F(InstanceFencingExecutorTest, FencingPreservesRoles) {
  auto const roles_before = cluster_.Roles();
  executor_.Fence("pg-1");
  executor_.Fence("pg-2");
  EXPECT_EQ(cluster_.Roles(), roles_before);
  EXPECT_EQ(cluster_.CurrentRoleAssignment()->primary, "pg-1");
}

TEST_F(InstanceFencingExecutorTest, UnfencedReplicaResumesStreaming) {
  executor_.Fence("pg-2");
  EXPECT_EQ(cluster_.Snapshot("pg-2").wal_receivers, 0);

  executor_.Unfence("pg-2");
  auto const replica = cluster_.Snapshot("pg-2");
  EXPECT_TRUE(cluster_.TryConnect("pg-2"));
  EXPECT_EQ(replica.wal_receivers, 1);
  EXPECT_EQ(replica.upstream, "pg-1");
  EXPECT_EQ(replica.role, ClusterRole::REPLICA);

  // A repeated unfence doesn't open a second replication connection.
  executor_.Unfence("pg-2");
  EXPECT_EQ(cluster_.Snapshot("pg-2").wal_receivers, 1);
}

TEST_F(InstanceFencingExecutorTest, UnfencedPrimaryDoesNotStream) {
  executor_.Fence("pg-1");
  executor_.Unfence("pg-1");
  auto const primary = cluster_.Snapshot("pg-1");
  EXPECT_TRUE(cluster_.TryConnect("pg-1"));
  EXPECT_EQ(primary.resume_calls, 0);
  EXPECT_EQ(primary.role, ClusterRole::PRIMARY);
}

TEST_F(InstanceFencingExecutorTest, UnreachableInstanceFails) {
  cluster_.SetReachable("pg-3", false);
  EXPECT_THROW(executor_.Fence("pg-3"), ExecutionError);
  EXPECT_THROW(executor_.Unfence("pg-3"), ExecutionError);
}

TEST_F(InstanceFencingExecutorTest, UnknownInstanceFails) { EXPECT_THROW(executor_.Fence("pg-9"), ExecutionError); }

TEST_F(InstanceFencingExecutorTest, SlowInstanceTimesOut) {
  cluster_.SetCallDelay("pg-2", 1000ms);
  auto const start = std::chrono::steady_clock::now();
  EXPECT_THROW(executor_.Fence("pg-2"), ExecutionError);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 900ms);
}

TEST_F(InstanceFencingExecutorTest, UnfenceNeedsKnownPrimary) {
  executor_.Fence("pg-2");
  cluster_.SetRolesUnknown(true);
  EXPECT_THROW(executor_.Unfence("pg-2"), ExecutionError);
  EXPECT_FALSE(cluster_.TryConnect("pg-2"));
}

TEST_F(InstanceFencingExecutorTest, TimedOutCallKeepsInstanceBusy) {
  cluster_.SetCallDelay("pg-2", 1000ms);
  EXPECT_THROW(executor_.Fence("pg-2"), ExecutionError);

  // The abandoned stop is still running, so an unfence must not start alongside it.
  auto const start = std::chrono::steady_clock::now();
  EXPECT_THROW(executor_.Unfence("pg-2"), ExecutionError);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
  EXPECT_EQ(cluster_.Snapshot("pg-2").start_calls, 0);
}

TEST_F(InstanceFencingExecutorTest, HungInstanceDoesNotDelayOthers) {
  cluster_.SetCallDelay("pg-2", 1000ms);
  EXPECT_THROW(executor_.Fence("pg-2"), ExecutionError);

  auto const start = std::chrono::steady_clock::now();
  executor_.Fence("pg-3");
  executor_.Fence("pg-1");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 200ms);
  EXPECT_FALSE(cluster_.TryConnect("pg-3"));
  EXPECT_FALSE(cluster_.TryConnect("pg-1"));
}

TEST_F(InstanceFencingExecutorTest, AbandonedCallFreesInstanceOnReturn) {
  cluster_.SetCallDelay("pg-2", 400ms);
  EXPECT_THROW(executor_.Fence("pg-2"), ExecutionError);
  cluster_.SetCallDelay("pg-2", 0ms);

  ASSERT_TRUE(WaitFor([this] {
    try {
      executor_.Unfence("pg-2");
      return true;
    } catch (ExecutionError const &) {
      return false;
    }
  }));
  auto const replica = cluster_.Snapshot("pg-2");
  EXPECT_TRUE(cluster_.TryConnect("pg-2"));
  EXPECT_EQ(replica.stop_calls, 1);
  EXPECT_EQ(replica.wal_receivers, 1);
  EXPECT_EQ(replica.max_active_calls, 1);
}
