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

#include "fencing/fencing_reconciler.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <mutex>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "fencing/exceptions.hpp"
#include "utils/logging.hpp"

namespace pgfence::fencing {

namespace {

// The requested state an instance moves to, std::nullopt when it already matches the declaration.
// A requested state left behind by a failed call is requested again.
auto NextRequest(InstanceFencingState state, bool declared_fenced) -> std::optional<InstanceFencingState> {
  if (declared_fenced) {
    if (state == InstanceFencingState::FENCED) return std::nullopt;
    return InstanceFencingState::FENCING_REQUESTED;
  }
  if (state == InstanceFencingState::UNFENCED) return std::nullopt;
  return InstanceFencingState::UNFENCING_REQUESTED;
}

auto CurrentAssignment(std::vector<InstanceStatus> const &instances) -> std::optional<ClusterRoleAssignment> {
  auto primary = std::ranges::find(instances, ClusterRole::PRIMARY, &InstanceStatus::role);
  if (primary == instances.end()) return std::nullopt;
  return ClusterRoleAssignment{.primary = primary->name};
}

}  // namespace

class FencingReconciler::DeclarationObserver final : public utils::Observer<VersionedFencingSet> {
 public:
  explicit DeclarationObserver(FencingReconciler *reconciler) : reconciler_(reconciler) {}

  void Update(VersionedFencingSet const &declaration) override {
    auto lock = std::unique_lock{mutex_};
    if (reconciler_ == nullptr) return;
    spdlog::trace("Fencing declaration changed to {} (version {}).", ToString(declaration.fencing_set),
                  declaration.version);
    reconciler_->Trigger();
  }

  // Waits for a notification in progress. Later notifications are ignored.
  void Disconnect() {
    auto lock = std::unique_lock{mutex_};
    reconciler_ = nullptr;
  }

 private:
  std::mutex mutex_;
  FencingReconciler *reconciler_;
};

FencingReconciler::FencingReconciler(ReconcilerConfig config, DeclarationStore &store,
                                     InstanceInventory const &inventory, FencingExecutor &executor,
                                     TopologyGuard &guard)
    : config_(std::move(config)),
      store_(&store),
      inventory_(&inventory),
      executor_(&executor),
      guard_(&guard),
      workers_(config_.workers, "fence_reconcile") {
  PGF_ASSERT(config_.workers > 0, "Reconciler needs at least one worker.");
}

FencingReconciler::~FencingReconciler() { Stop(); }

void FencingReconciler::Start() {
  PGF_ASSERT(!stopped_, "Fencing reconciler can't be restarted.");
  if (declaration_observer_) return;

  declaration_observer_ = std::make_shared<DeclarationObserver>(this);
  store_->Attach(declaration_observer_);
  resync_.Run("fence_resync", config_.resync_interval, [this] { Trigger(); });
  spdlog::info("Fencing reconciler started for cluster {}, resync every {}ms.", config_.cluster_name,
               config_.resync_interval.count());
  Trigger();
}

void FencingReconciler::Stop() {
  if (stopped_.exchange(true)) return;

  resync_.Stop();
  if (declaration_observer_) {
    store_->Detach(declaration_observer_);
    // A Set racing with Stop may still be notifying the detached observer.
    declaration_observer_->Disconnect();
    declaration_observer_.reset();
  }
  workers_.ShutDown();
  spdlog::trace("Fencing reconciler for cluster {} stopped.", config_.cluster_name);
}

void FencingReconciler::Trigger() {
  if (stopped_) return;
  workers_.AddTask([this] { Reconcile(); });
}

auto FencingReconciler::Reconcile() -> ReconcileReport {
  ReconcileReport report;

  VersionedFencingSet declaration;
  std::vector<InstanceStatus> instances;
  try {
    declaration = store_->Get();
    instances = inventory_->ListInstances(config_.cluster_name);
  } catch (std::exception const &e) {
    spdlog::error("Abandoning fencing pass for cluster {}: {}", config_.cluster_name, e.what());
    last_pass_aborted_ = true;
    report.aborted = true;
    return report;
  }
  last_pass_aborted_ = false;

  std::vector<std::string> live_names;
  live_names.reserve(instances.size());
  std::ranges::transform(instances, std::back_inserter(live_names), &InstanceStatus::name);
  auto const fenced = declaration.fencing_set.Resolve(live_names);

  auto const now = std::chrono::steady_clock::now();
  std::vector<Operation> operations;

  records_.WithLock([&](Records &table) {
    auto &records = table.instances;
    for (auto it = records.begin(); it != records.end();) {
      if (std::ranges::find(live_names, it->first) != live_names.end()) {
        ++it;
        continue;
      }
      spdlog::info("Instance {} left cluster {}, forgetting its fencing state {}.", it->first, config_.cluster_name,
                   it->second.state);
      guard_->Release(it->first);
      report.dropped.push_back(it->first);
      it = records.erase(it);
    }

    for (auto const &instance : instances) {
      auto [it, inserted] = records.try_emplace(instance.name, config_.retry_backoff_initial,
                                                config_.retry_backoff_max, next_generation_++);
      auto &record = it->second;
      record.role = instance.role;
      record.declared_fenced = fenced.contains(instance.name);

      auto const requested = NextRequest(record.state, record.declared_fenced);
      if (!requested) continue;

      if (table.executing.contains(instance.name)) {
        // The outcome of the outstanding call decides what's left to do. For a
        // re-added instance the call belongs to its predecessor, and the
        // follow-up pass starts from this record's state.
        record.resync_requested = true;
        report.in_flight.push_back(instance.name);
        continue;
      }

      if (record.failed_request == *requested && now < record.next_attempt) {
        report.backing_off.push_back(instance.name);
        continue;
      }

      if (record.state != *requested) {
        spdlog::debug("Instance {} ({}) moves from {} to {}.", instance.name, instance.role, record.state, *requested);
        record.state = *requested;
      }
      if (*requested == InstanceFencingState::FENCING_REQUESTED) {
        guard_->Freeze(instance.name);
        report.fencing.push_back(instance.name);
      } else {
        report.unfencing.push_back(instance.name);
      }

      table.executing.insert(instance.name);
      operations.push_back(Operation{
          .instance_name = instance.name, .requested = *requested, .generation = record.generation});
    }
  });

  if (auto const assignment = CurrentAssignment(instances)) {
    guard_->CheckRoleAssignment(*assignment);
  }

  for (auto &operation : operations) {
    workers_.AddTask([this, operation = std::move(operation)] { Execute(operation); });
  }

  if (!operations.empty() || !report.dropped.empty()) {
    spdlog::debug("Fencing pass for cluster {}: fencing [{}], unfencing [{}], busy [{}], backing off [{}].",
                  config_.cluster_name, fmt::join(report.fencing, ", "), fmt::join(report.unfencing, ", "),
                  fmt::join(report.in_flight, ", "), fmt::join(report.backing_off, ", "));
  }
  return report;
}

void FencingReconciler::Execute(Operation const &operation) {
  auto const fence = operation.requested == InstanceFencingState::FENCING_REQUESTED;
  std::optional<std::string> error;
  try {
    if (fence) {
      executor_->Fence(operation.instance_name);
    } else {
      executor_->Unfence(operation.instance_name);
    }
  } catch (ExecutionError const &e) {
    error = e.what();
  } catch (std::exception const &e) {
    error = fmt::format("unexpected error: {}", e.what());
  }

  bool resync{false};
  records_.WithLock([&](Records &table) {
    table.executing.erase(operation.instance_name);
    auto it = table.instances.find(operation.instance_name);
    if (it == table.instances.end()) {
      spdlog::debug("Discarding result for instance {}, it left cluster {}.", operation.instance_name,
                    config_.cluster_name);
      return;
    }

    auto &record = it->second;
    resync = std::exchange(record.resync_requested, false);
    if (record.generation != operation.generation) {
      spdlog::debug("Discarding result for instance {}, it rejoined cluster {} meanwhile.", operation.instance_name,
                    config_.cluster_name);
      return;
    }

    if (error) {
      auto const delay = record.backoff.calculate_delay();
      record.failed_request = operation.requested;
      record.next_attempt = std::chrono::steady_clock::now() + delay;
      spdlog::warn("{} of instance {} failed, next attempt in {}ms: {}", fence ? "Fencing" : "Unfencing",
                   operation.instance_name, delay.count(), *error);
      return;
    }

    record.state = ConfirmedState(operation.requested);
    record.failed_request.reset();
    record.backoff.reset();
    if (record.state == InstanceFencingState::UNFENCED) {
      guard_->Release(operation.instance_name);
    }
    spdlog::debug("Instance {} is {}.", operation.instance_name, record.state);
  });

  if (resync) Trigger();
}

auto FencingReconciler::GetState(std::string_view instance_name) const -> std::optional<InstanceFencingState> {
  return records_.WithLock([&](Records const &table) -> std::optional<InstanceFencingState> {
    auto it = table.instances.find(instance_name);
    if (it == table.instances.end()) return std::nullopt;
    return it->second.state;
  });
}

auto FencingReconciler::States() const -> std::map<std::string, InstanceFencingState, std::less<>> {
  std::map<std::string, InstanceFencingState, std::less<>> states;
  records_.WithLock([&](Records const &table) {
    for (auto const &[name, record] : table.instances) states.emplace(name, record.state);
  });
  return states;
}

auto FencingReconciler::IsConverged() const -> bool {
  if (last_pass_aborted_) return false;
  return records_.WithLock([](Records const &table) {
    if (!table.executing.empty()) return false;
    return std::ranges::all_of(table.instances, [](auto const &entry) {
      auto const &record = entry.second;
      return !NextRequest(record.state, record.declared_fenced).has_value();
    });
  });
}

auto FencingReconciler::PendingOperations() const -> size_t {
  return records_.WithLock([](Records const &table) { return table.executing.size(); });
}

auto FencingReconciler::QueuedTasks() const -> size_t { return workers_.UnfinishedTasksNum(); }

auto FencingReconciler::StatusJson() const -> nlohmann::json {
  auto instances = nlohmann::json::array();
  records_.WithLock([&](Records const &table) {
    for (auto const &[name, record] : table.instances) {
      instances.push_back({{"name", name},
                           {"role", record.role},
                           {"state", record.state},
                           {"declared_fenced", record.declared_fenced},
                           {"in_flight", table.executing.contains(name)}});
    }
  });
  return {{"cluster", config_.cluster_name}, {"converged", IsConverged()}, {"instances", std::move(instances)}};
}

}  // namespace pgfence::fencing
