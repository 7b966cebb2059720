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

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "fencing/cluster_interfaces.hpp"
#include "utils/synchronized.hpp"

namespace pgfence::fencing {

// Freezes the role of every instance while fencing is requested or in effect.
// Primary election and switchover automation ask it before touching an
// instance: a fenced primary stays the primary, it is never demoted because it
// is fenced, and a fenced replica is never promoted.
class TopologyGuard {
 public:
  explicit TopologyGuard(RoleProvider const &roles);

  // Records the role the instance has right now. Freezing an already frozen instance keeps the first role.
  void Freeze(std::string_view instance_name);
  void Release(std::string_view instance_name);

  auto IsRoleChangeAllowed(std::string_view instance_name) const -> bool;
  // Both sides of a switchover or failover must be free to change role.
  auto IsSwitchoverAllowed(std::string_view from_instance, std::string_view to_instance) const -> bool;

  // Returns the frozen instances whose role differs in the given assignment.
  auto CheckRoleAssignment(ClusterRoleAssignment const &assignment) const -> std::vector<std::string>;

  auto FrozenInstances() const -> std::map<std::string, ClusterRole, std::less<>>;

 private:
  RoleProvider const *roles_;
  utils::Synchronized<std::map<std::string, ClusterRole, std::less<>>> frozen_roles_;
};

}  // namespace pgfence::fencing
