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

#include "fencing/role.hpp"

#include <array>
#include <utility>

#include <nlohmann/json.hpp>
#include <range/v3/algorithm/find.hpp>

#include "fencing/exceptions.hpp"

namespace pgfence::fencing {

namespace {
constexpr std::array<std::pair<ClusterRole, std::string_view>, 2> kRoleMapping{
    {{ClusterRole::PRIMARY, "primary"}, {ClusterRole::REPLICA, "replica"}}};
}  // namespace

auto ToString(ClusterRole const role) -> std::string_view {
  const auto it = ranges::find(kRoleMapping, role, &std::pair<ClusterRole, std::string_view>::first);
  return it != kRoleMapping.end() ? it->second : kRoleMapping.back().second;
}

void to_json(nlohmann::json &j, ClusterRole const &role) { j = std::string{ToString(role)}; }

void from_json(nlohmann::json const &j, ClusterRole &role) {
  const auto value = j.get<std::string>();
  const auto it = ranges::find(kRoleMapping, value, &std::pair<ClusterRole, std::string_view>::second);
  if (it == kRoleMapping.end()) {
    throw InvalidFencingRequest("Unknown cluster role '{}'.", value);
  }
  role = it->first;
}

}  // namespace pgfence::fencing
