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

#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace pgfence::fencing {

// Name of the cluster-scoped key holding the declaration.
inline constexpr std::string_view kFencedInstancesKey{"pgfence.io/fencedInstances"};
// Reserved element meaning "every instance of the cluster".
inline constexpr std::string_view kFenceAllInstances{"*"};

// Declared intent: either an explicit set of instance names or the wildcard.
class FencingSet {
 public:
  using Names = std::set<std::string, std::less<>>;

  struct All {
    friend bool operator==(All const &, All const &) = default;
  };

  FencingSet() = default;
  explicit FencingSet(Names names);
  FencingSet(std::initializer_list<std::string_view> names);

  static auto FenceAll() -> FencingSet;

  auto IsAll() const -> bool;
  // True for Explicit(∅).
  auto IsEmpty() const -> bool;
  // nullptr when the set is the wildcard.
  auto ExplicitNames() const -> Names const *;
  // Wildcard contains every name.
  auto Contains(std::string_view instance_name) const -> bool;

  // Resolves the wildcard against the live instance names. Explicit names that
  // aren't live are left out.
  auto Resolve(std::vector<std::string> const &live_instances) const -> Names;

  // Returns a copy with the name added. Adding to the wildcard is a no-op.
  auto With(std::string_view instance_name) const -> FencingSet;
  // Returns a copy with the name removed. Removing from the wildcard is a no-op.
  auto Without(std::string_view instance_name) const -> FencingSet;

  friend bool operator==(FencingSet const &, FencingSet const &) = default;

 private:
  std::variant<Names, All> value_;
};

// Validates a single instance name as used in commands and annotations.
// @throw InvalidFencingRequest
void ValidateInstanceName(std::string_view instance_name);

// JSON array of strings; explicit names come out in ascending order. The
// wildcard is ["*"] and the empty set is [].
auto EncodeFencingSet(FencingSet const &fencing_set) -> std::string;

// Accepts the key value as stored. An empty string is the empty set.
// @throw InvalidFencingRequest on malformed input.
auto DecodeFencingSet(std::string_view raw) -> FencingSet;

auto ToString(FencingSet const &fencing_set) -> std::string;

void to_json(nlohmann::json &j, FencingSet const &fencing_set);
void from_json(nlohmann::json const &j, FencingSet &fencing_set);

}  // namespace pgfence::fencing
