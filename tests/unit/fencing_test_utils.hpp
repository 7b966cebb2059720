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

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "fencing/cluster_interfaces.hpp"

namespace pgfence::fencing::test {

// In-memory cluster playing the inventory, the role provider and the instance
// control capability. The first instance is the primary, every other one a
// streaming replica of it. A refused or unreachable instance drops its WAL
// receiver and only gets it back through ResumeStreaming. Concurrent calls are
// counted by name, so a removed and re-added instance keeps its counters.
class SimulatedCluster final : public InstanceInventory, public RoleProvider, public InstanceControl {
 public:
  struct Instance {
    std::string name;
    ClusterRole role{ClusterRole::REPLICA};
    bool accepting{true};
    bool reachable{true};
    uint32_t wal_receivers{0};
    std::string upstream;
    std::chrono::milliseconds call_delay{0};
    uint32_t stop_calls{0};
    uint32_t start_calls{0};
    uint32_t resume_calls{0};
    uint32_t active_calls{0};
    uint32_t max_active_calls{0};
  };

  explicit SimulatedCluster(std::vector<std::string> const &names) {
    for (auto const &name : names) {
      AddInstance(name);
    }
  }

  void AddInstance(std::string const &name) {
    auto lock = std::unique_lock{mutex_};
    Instance instance{.name = name};
    auto primary = std::ranges::find(instances_, ClusterRole::PRIMARY, &Instance::role);
    if (primary == instances_.end()) {
      instance.role = ClusterRole::PRIMARY;
    } else {
      instance.wal_receivers = 1;
      instance.upstream = primary->name;
    }
    instances_.push_back(std::move(instance));
  }

  void RemoveInstance(std::string_view name) {
    auto lock = std::unique_lock{mutex_};
    std::erase_if(instances_, [&](auto const &instance) { return instance.name == name; });
  }

  void SetReachable(std::string_view name, bool reachable) {
    WithInstance(name, [&](Instance &instance) {
      instance.reachable = reachable;
      if (!reachable) instance.wal_receivers = 0;
    });
  }

  void SetCallDelay(std::string_view name, std::chrono::milliseconds delay) {
    WithInstance(name, [&](Instance &instance) { instance.call_delay = delay; });
  }

  void SetInventoryFailing(bool failing) {
    auto lock = std::unique_lock{mutex_};
    inventory_failing_ = failing;
  }

  void SetRolesUnknown(bool unknown) {
    auto lock = std::unique_lock{mutex_};
    roles_unknown_ = unknown;
  }

  // Moves the primary designation, as a switchover would.
  void Promote(std::string_view name) {
    auto lock = std::unique_lock{mutex_};
    for (auto &instance : instances_) {
      instance.role = instance.name == name ? ClusterRole::PRIMARY : ClusterRole::REPLICA;
    }
  }

  // A client connection attempt.
  auto TryConnect(std::string_view name) const -> bool {
    auto lock = std::unique_lock{mutex_};
    auto const *instance = Find(name);
    return instance != nullptr && instance->reachable && instance->accepting;
  }

  auto Snapshot(std::string_view name) const -> Instance {
    auto lock = std::unique_lock{mutex_};
    auto const *instance = Find(name);
    if (instance == nullptr) throw std::out_of_range(std::string{name});
    auto snapshot = *instance;
    if (auto it = active_calls_.find(name); it != active_calls_.end()) snapshot.active_calls = it->second;
    if (auto it = max_active_calls_.find(name); it != max_active_calls_.end()) snapshot.max_active_calls = it->second;
    return snapshot;
  }

  auto Roles() const -> std::map<std::string, ClusterRole> {
    auto lock = std::unique_lock{mutex_};
    std::map<std::string, ClusterRole> roles;
    for (auto const &instance : instances_) roles.emplace(instance.name, instance.role);
    return roles;
  }

  auto ListInstances(std::string_view /*cluster_name*/) const -> std::vector<InstanceStatus> override {
    auto lock = std::unique_lock{mutex_};
    if (inventory_failing_) throw std::runtime_error("inventory unavailable");
    std::vector<InstanceStatus> statuses;
    for (auto const &instance : instances_) {
      statuses.push_back(InstanceStatus{
          .name = instance.name, .ready = instance.reachable && instance.accepting, .role = instance.role});
    }
    return statuses;
  }

  auto CurrentRoleAssignment() const -> std::optional<ClusterRoleAssignment> override {
    auto lock = std::unique_lock{mutex_};
    if (roles_unknown_) return std::nullopt;
    auto primary = std::ranges::find(instances_, ClusterRole::PRIMARY, &Instance::role);
    if (primary == instances_.end()) return std::nullopt;
    return ClusterRoleAssignment{.primary = primary->name};
  }

  auto StopAcceptingConnections(std::string_view name) -> bool override {
    return Call(name, [](Instance &instance) {
      ++instance.stop_calls;
      instance.accepting = false;
      instance.wal_receivers = 0;
    });
  }

  auto StartAcceptingConnections(std::string_view name) -> bool override {
    return Call(name, [](Instance &instance) {
      ++instance.start_calls;
      instance.accepting = true;
    });
  }

  auto ResumeStreaming(std::string_view name, std::string_view upstream) -> bool override {
    return Call(name, [&](Instance &instance) {
      ++instance.resume_calls;
      instance.upstream = std::string{upstream};
      instance.wal_receivers = 1;
    });
  }

  auto ProbeAcceptingConnections(std::string_view name) const -> std::optional<bool> override {
    auto lock = std::unique_lock{mutex_};
    auto const *instance = Find(name);
    if (instance == nullptr || !instance->reachable) return std::nullopt;
    return instance->accepting;
  }

 private:
  auto Find(std::string_view name) const -> Instance const * {
    auto it = std::ranges::find(instances_, name, &Instance::name);
    return it == instances_.end() ? nullptr : &*it;
  }

  auto Find(std::string_view name) -> Instance * {
    auto it = std::ranges::find(instances_, name, &Instance::name);
    return it == instances_.end() ? nullptr : &*it;
  }

  void WithInstance(std::string_view name, std::function<void(Instance &)> const &change) {
    auto lock = std::unique_lock{mutex_};
    auto *instance = Find(name);
    if (instance == nullptr) throw std::out_of_range(std::string{name});
    change(*instance);
  }

  // Counts concurrent calls per instance and applies the change after the configured delay.
  auto Call(std::string_view name, std::function<void(Instance &)> const &change) -> bool {
    std::chrono::milliseconds delay{0};
    {
      auto lock = std::unique_lock{mutex_};
      auto *instance = Find(name);
      if (instance == nullptr || !instance->reachable) return false;
      auto &active = active_calls_[std::string{name}];
      ++active;
      auto &max_active = max_active_calls_[std::string{name}];
      max_active = std::max(max_active, active);
      delay = instance->call_delay;
    }

    if (delay.count() > 0) std::this_thread::sleep_for(delay);

    auto lock = std::unique_lock{mutex_};
    --active_calls_.find(name)->second;
    auto *instance = Find(name);
    if (instance == nullptr || !instance->reachable) return false;
    change(*instance);
    return true;
  }

  mutable std::mutex mutex_;
  std::vector<Instance> instances_;
  std::map<std::string, uint32_t, std::less<>> active_calls_;
  std::map<std::string, uint32_t, std::less<>> max_active_calls_;
  bool inventory_failing_{false};
  bool roles_unknown_{false};
};

// Polls until the condition holds or the timeout passes.
inline auto WaitFor(std::function<bool()> const &condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) -> bool {
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

}  // namespace pgfence::fencing::test
