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

#include "fencing/fencing_set.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include "fencing/exceptions.hpp"

namespace pgfence::fencing {

FencingSet::FencingSet(Names names) : value_(std::move(names)) {}

FencingSet::FencingSet(std::initializer_list<std::string_view> names) {
  Names explicit_names;
  for (auto const name : names) {
    explicit_names.emplace(name);
  }
  value_ = std::move(explicit_names);
}

auto FencingSet::FenceAll() -> FencingSet {
  FencingSet fencing_set;
  fencing_set.value_ = All{};
  return fencing_set;
}

auto FencingSet::IsAll() const -> bool { return std::holds_alternative<All>(value_); }

auto FencingSet::IsEmpty() const -> bool {
  auto const *names = std::get_if<Names>(&value_);
  return names != nullptr && names->empty();
}

auto FencingSet::ExplicitNames() const -> Names const * { return std::get_if<Names>(&value_); }

auto FencingSet::Contains(std::string_view instance_name) const -> bool {
  if (IsAll()) return true;
  return std::get<Names>(value_).contains(instance_name);
}

auto FencingSet::Resolve(std::vector<std::string> const &live_instances) const -> Names {
  Names resolved;
  for (auto const &instance : live_instances) {
    if (Contains(instance)) resolved.emplace(instance);
  }
  return resolved;
}

auto FencingSet::With(std::string_view instance_name) const -> FencingSet {
  if (IsAll()) return *this;
  auto names = std::get<Names>(value_);
  names.emplace(instance_name);
  return FencingSet{std::move(names)};
}

auto FencingSet::Without(std::string_view instance_name) const -> FencingSet {
  if (IsAll()) return *this;
  auto names = std::get<Names>(value_);
  if (auto it = names.find(instance_name); it != names.end()) names.erase(it);
  return FencingSet{std::move(names)};
}

void ValidateInstanceName(std::string_view instance_name) {
  if (instance_name.empty()) {
    throw InvalidFencingRequest("Instance name cannot be empty.");
  }
  if (instance_name.find(kFenceAllInstances) != std::string_view::npos) {
    throw InvalidFencingRequest("Instance name '{}' is invalid, '{}' is reserved for fencing all instances.",
                                instance_name, kFenceAllInstances);
  }
  auto const is_invalid_char = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0 || c == '"'; };
  if (std::any_of(instance_name.begin(), instance_name.end(), is_invalid_char)) {
    throw InvalidFencingRequest("Instance name '{}' contains invalid characters.", instance_name);
  }
}

auto EncodeFencingSet(FencingSet const &fencing_set) -> std::string {
  return nlohmann::json(fencing_set).dump();
}

auto DecodeFencingSet(std::string_view raw) -> FencingSet {
  if (raw.find_first_not_of(" \t\r\n") == std::string_view::npos) return FencingSet{};

  auto const json = nlohmann::json::parse(raw, nullptr, /*allow_exceptions=*/false);
  if (json.is_discarded()) {
    throw InvalidFencingRequest("Fenced instances value '{}' is not valid JSON.", raw);
  }
  return json.get<FencingSet>();
}

auto ToString(FencingSet const &fencing_set) -> std::string {
  if (fencing_set.IsAll()) return "all instances";
  auto const *names = fencing_set.ExplicitNames();
  if (names->empty()) return "no instances";
  return fmt::format("[{}]", fmt::join(*names, ", "));
}

void to_json(nlohmann::json &j, FencingSet const &fencing_set) {
  j = nlohmann::json::array();
  if (fencing_set.IsAll()) {
    j.push_back(std::string{kFenceAllInstances});
    return;
  }
  for (auto const &name : *fencing_set.ExplicitNames()) {
    j.push_back(name);
  }
}

void from_json(nlohmann::json const &j, FencingSet &fencing_set) {
  if (!j.is_array()) {
    throw InvalidFencingRequest("Fenced instances must be a JSON array of strings, got '{}'.", j.dump());
  }

  FencingSet::Names names;
  bool fence_all{false};
  for (auto const &element : j) {
    if (!element.is_string()) {
      throw InvalidFencingRequest("Fenced instances must be a JSON array of strings, got '{}'.", j.dump());
    }
    auto const &name = element.get_ref<std::string const &>();
    if (name == kFenceAllInstances) {
      fence_all = true;
      continue;
    }
    ValidateInstanceName(name);
    names.emplace(name);
  }

  if (fence_all && !names.empty()) {
    throw InvalidFencingRequest("'{}' cannot be combined with instance names, got '{}'.", kFenceAllInstances,
                                j.dump());
  }
  fencing_set = fence_all ? FencingSet::FenceAll() : FencingSet{std::move(names)};
}

}  // namespace pgfence::fencing
