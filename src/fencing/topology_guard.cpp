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

#include "fencing/topology_guard.hpp"

#include "utils/logging.hpp"

namespace pgfence::fencing {

TopologyGuard::TopologyGuard(RoleProvider const &roles) : roles_(&roles) {}

void TopologyGuard::Freeze(std::string_view instance_name) {
  auto const assignment = roles_->CurrentRoleAssignment();
  if (!assignment) {
    spdlog::warn("Primary unknown while freezing the role of instance {}, recording it as replica.", instance_name);
  }
  auto const role = assignment ? assignment->RoleOf(instance_name) : ClusterRole::REPLICA;

  frozen_roles_.WithLock([&](auto &frozen_roles) {
    if (auto const [it, inserted] = frozen_roles.try_emplace(std::string{instance_name}, role); inserted) {
      spdlog::debug("Role {} of instance {} is frozen.", role, instance_name);
    }
  });
}

void TopologyGuard::Release(std::string_view instance_name) {
  frozen_roles_.WithLock([&](auto &frozen_roles) {
    if (auto it = frozen_roles.find(instance_name); it != frozen_roles.end()) {
      spdlog::debug("Role {} of instance {} is released.", it->second, instance_name);
      frozen_roles.erase(it);
    }
  });
}

auto TopologyGuard::IsRoleChangeAllowed(std::string_view instance_name) const -> bool {
  return frozen_roles_.WithLock(
      [&](auto const &frozen_roles) { return !frozen_roles.contains(instance_name); });
}

auto TopologyGuard::IsSwitchoverAllowed(std::string_view from_instance, std::string_view to_instance) const -> bool {
  return IsRoleChangeAllowed(from_instance) && IsRoleChangeAllowed(to_instance);
}

auto TopologyGuard::CheckRoleAssignment(ClusterRoleAssignment const &assignment) const -> std::vector<std::string> {
  std::vector<std::string> violations;
  frozen_roles_.WithLock([&](auto const &frozen_roles) {
    for (auto const &[instance_name, frozen_role] : frozen_roles) {
      if (auto const role = assignment.RoleOf(instance_name); role != frozen_role) {
        spdlog::error("Instance {} changed role from {} to {} while fenced.", instance_name, frozen_role, role);
        violations.push_back(instance_name);
      }
    }
  });
  return violations;
}

auto TopologyGuard::FrozenInstances() const -> std::map<std::string, ClusterRole, std::less<>> {
  return *frozen_roles_.Lock();
}

}  // namespace pgfence::fencing
