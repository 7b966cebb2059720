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

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fencing/role.hpp"

namespace pgfence::fencing {

// One member of the cluster as reported by the inventory.
struct InstanceStatus {
  std::string name;
  bool ready{false};  // readiness signal, owned by the instance's health reporting
  ClusterRole role{ClusterRole::REPLICA};

  friend bool operator==(InstanceStatus const &, InstanceStatus const &) = default;
};

// Live instance inventory of a cluster.
class InstanceInventory {
 public:
  virtual ~InstanceInventory() = default;

  // Returns current members in a stable order. Throws when the inventory can't be read.
  virtual auto ListInstances(std::string_view cluster_name) const -> std::vector<InstanceStatus> = 0;
};

// Read access to the current primary/replica designation. Not owned by fencing.
class RoleProvider {
 public:
  virtual ~RoleProvider() = default;

  // std::nullopt when the designation can't be determined right now.
  virtual auto CurrentRoleAssignment() const -> std::optional<ClusterRoleAssignment> = 0;
};

// Capability used to toggle client traffic on an instance. Every call must be
// idempotent and returns false when the instance couldn't be changed.
class InstanceControl {
 public:
  virtual ~InstanceControl() = default;

  virtual auto StopAcceptingConnections(std::string_view instance_name) -> bool = 0;
  virtual auto StartAcceptingConnections(std::string_view instance_name) -> bool = 0;

  // Re-establishes the replication connection of a replica to the given upstream.
  virtual auto ResumeStreaming(std::string_view instance_name, std::string_view upstream) -> bool = 0;

  // std::nullopt when the instance is unreachable.
  virtual auto ProbeAcceptingConnections(std::string_view instance_name) const -> std::optional<bool> = 0;
};

}  // namespace pgfence::fencing
