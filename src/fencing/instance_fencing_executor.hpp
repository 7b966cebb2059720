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

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <thread>

#include "fencing/cluster_interfaces.hpp"
#include "fencing/config.hpp"
#include "utils/synchronized.hpp"

namespace pgfence::fencing {

// Per-instance side effects of fencing. Both operations must be safe to repeat.
class FencingExecutor {
 public:
  virtual ~FencingExecutor() = default;

  // @throw ExecutionError
  virtual void Fence(std::string_view instance_name) = 0;
  // @throw ExecutionError
  virtual void Unfence(std::string_view instance_name) = 0;
};

// Fences by making the instance refuse client connections, which also turns its
// readiness signal off. Role metadata and replication machinery are never
// touched. Unfencing lets connections in again and, on a replica, reconnects it
// to the current primary.
//
// Every call into InstanceControl runs on its own thread and is abandoned after
// the configured timeout, so a hung instance can't stall the caller. An instance
// has at most one call outstanding: until an abandoned call returns, further
// calls on that instance fail with ExecutionError. Other instances aren't
// affected.
class InstanceFencingExecutor final : public FencingExecutor {
 public:
  InstanceFencingExecutor(InstanceControl &control, RoleProvider const &roles, ExecutorConfig config);
  // Waits for abandoned calls to return.
  ~InstanceFencingExecutor() override;

  InstanceFencingExecutor(InstanceFencingExecutor const &) = delete;
  InstanceFencingExecutor &operator=(InstanceFencingExecutor const &) = delete;
  InstanceFencingExecutor(InstanceFencingExecutor &&) = delete;
  InstanceFencingExecutor &operator=(InstanceFencingExecutor &&) = delete;

  void Fence(std::string_view instance_name) override;
  void Unfence(std::string_view instance_name) override;

 private:
  template <typename TResult>
  auto CallWithTimeout(std::string_view instance_name, std::string_view what, std::function<TResult()> call)
      -> TResult;

  void ExpectAcceptingConnections(std::string_view instance_name, bool expected);

  struct CallSlot {
    std::jthread thread;
    std::string running;
    bool busy{false};
  };

  InstanceControl *control_;
  RoleProvider const *roles_;
  ExecutorConfig config_;
  utils::Synchronized<std::map<std::string, CallSlot, std::less<>>> slots_;
};

}  // namespace pgfence::fencing
