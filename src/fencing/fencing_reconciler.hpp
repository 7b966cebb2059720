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

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "fencing/cluster_interfaces.hpp"
#include "fencing/config.hpp"
#include "fencing/declaration_store.hpp"
#include "fencing/instance_fencing_executor.hpp"
#include "fencing/instance_fencing_state.hpp"
#include "fencing/topology_guard.hpp"
#include "utils/exponential_backoff.hpp"
#include "utils/scheduler.hpp"
#include "utils/synchronized.hpp"
#include "utils/thread_pool.hpp"

namespace pgfence::fencing {

// Outcome of a single reconciliation pass.
struct ReconcileReport {
  std::vector<std::string> fencing;      // Fence dispatched
  std::vector<std::string> unfencing;    // Unfence dispatched
  std::vector<std::string> in_flight;    // needs work but a call is still outstanding
  std::vector<std::string> backing_off;  // last attempt failed, retry not due yet
  std::vector<std::string> dropped;      // left the inventory
  bool aborted{false};                   // declaration or inventory couldn't be read
};

// Level-triggered control loop driving every live instance towards the declared
// fencing set.
//
// A pass reads the declaration and the inventory, resolves the wildcard against
// the instances that exist right now and dispatches Fence/Unfence calls to a
// worker pool. Instances are handled in parallel but at most one executor call
// per instance is outstanding; a pass that finds an instance busy asks for a
// follow-up pass once the call returns. Failed calls leave the instance in its
// requested state and are retried by a later pass after a per-instance backoff.
//
// Passes are triggered by declaration changes (once started), by Trigger() and
// by a periodic resync.
class FencingReconciler {
 public:
  FencingReconciler(ReconcilerConfig config, DeclarationStore &store, InstanceInventory const &inventory,
                    FencingExecutor &executor, TopologyGuard &guard);
  ~FencingReconciler();

  FencingReconciler(FencingReconciler const &) = delete;
  FencingReconciler &operator=(FencingReconciler const &) = delete;
  FencingReconciler(FencingReconciler &&) = delete;
  FencingReconciler &operator=(FencingReconciler &&) = delete;

  // Subscribes to declaration changes and starts the periodic resync.
  void Start();
  // Final; waits for outstanding executor calls.
  void Stop();

  // Requests an asynchronous pass, e.g. on an instance status change.
  void Trigger();
  // Runs one pass on the calling thread. Executor calls still run on the workers.
  auto Reconcile() -> ReconcileReport;

  auto GetState(std::string_view instance_name) const -> std::optional<InstanceFencingState>;
  auto States() const -> std::map<std::string, InstanceFencingState, std::less<>>;
  // Every known instance reached the declared state and nothing is outstanding.
  auto IsConverged() const -> bool;
  auto PendingOperations() const -> size_t;
  // Tasks queued or running on the workers, passes included.
  auto QueuedTasks() const -> size_t;

  auto StatusJson() const -> nlohmann::json;

 private:
  struct InstanceRecord {
    InstanceRecord(std::chrono::milliseconds backoff_initial, std::chrono::milliseconds backoff_max,
                   uint64_t generation)
        : generation(generation), backoff(backoff_initial, backoff_max) {}

    InstanceFencingState state{InstanceFencingState::UNFENCED};
    ClusterRole role{ClusterRole::REPLICA};
    bool declared_fenced{false};
    bool resync_requested{false};
    // Distinguishes a re-added instance from the one a late executor result belongs to.
    uint64_t generation;
    std::optional<InstanceFencingState> failed_request;
    std::chrono::steady_clock::time_point next_attempt{};
    utils::ExponentialBackoffInternals backoff;
  };

  struct Operation {
    std::string instance_name;
    InstanceFencingState requested;
    uint64_t generation;
  };

  class DeclarationObserver;

  void Execute(Operation const &operation);

  ReconcilerConfig config_;
  DeclarationStore *store_;
  InstanceInventory const *inventory_;
  FencingExecutor *executor_;
  TopologyGuard *guard_;

  struct Records {
    std::map<std::string, InstanceRecord, std::less<>> instances;
    // Names with an executor call outstanding. A name stays here until its call
    // returns, even when the instance is dropped and re-added meanwhile.
    std::set<std::string, std::less<>> executing;
  };

  utils::Synchronized<Records> records_;
  std::atomic<uint64_t> next_generation_{1};
  std::atomic<bool> last_pass_aborted_{false};
  std::atomic<bool> stopped_{false};

  std::shared_ptr<DeclarationObserver> declaration_observer_;
  utils::Scheduler resync_;
  utils::ThreadPool workers_;
};

}  // namespace pgfence::fencing
