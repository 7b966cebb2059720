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

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json_fwd.hpp>

namespace pgfence::fencing {

enum class ClusterRole : uint8_t { PRIMARY, REPLICA };

auto ToString(ClusterRole role) -> std::string_view;

// Exactly one instance is the primary, every other instance is a replica.
struct ClusterRoleAssignment {
  std::string primary;

  auto RoleOf(std::string_view instance_name) const -> ClusterRole {
    return instance_name == primary ? ClusterRole::PRIMARY : ClusterRole::REPLICA;
  }

  friend bool operator==(ClusterRoleAssignment const &, ClusterRoleAssignment const &) = default;
};

void to_json(nlohmann::json &j, ClusterRole const &role);
void from_json(nlohmann::json const &j, ClusterRole &role);

}  // namespace pgfence::fencing

template <>
struct fmt::formatter<pgfence::fencing::ClusterRole> : fmt::formatter<std::string_view> {
  auto format(pgfence::fencing::ClusterRole role, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(pgfence::fencing::ToString(role), ctx);
  }
};
