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

#include "fencing/instance_fencing_state.hpp"

#include <array>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "fencing/exceptions.hpp"
#include "utils/enum.hpp"
#include "utils/logging.hpp"

namespace pgfence::fencing {

namespace {
using namespace std::string_view_literals;

constexpr std::array kStateMapping{std::pair{"unfenced"sv, InstanceFencingState::UNFENCED},
                                   std::pair{"fencing_requested"sv, InstanceFencingState::FENCING_REQUESTED},
                                   std::pair{"fenced"sv, InstanceFencingState::FENCED},
                                   std::pair{"unfencing_requested"sv, InstanceFencingState::UNFENCING_REQUESTED}};
}  // namespace

auto ToString(InstanceFencingState const state) -> std::string_view {
  auto const name = utils::EnumToString(state, kStateMapping);
  PGF_ASSERT(name.has_value(), "Unknown instance fencing state {}", static_cast<int>(state));
  return *name;
}

auto IsInProgress(InstanceFencingState const state) -> bool {
  return state == InstanceFencingState::FENCING_REQUESTED || state == InstanceFencingState::UNFENCING_REQUESTED;
}

auto IsFencingInEffect(InstanceFencingState const state) -> bool {
  return state == InstanceFencingState::FENCING_REQUESTED || state == InstanceFencingState::FENCED;
}

auto ConfirmedState(InstanceFencingState const requested) -> InstanceFencingState {
  switch (requested) {
    case InstanceFencingState::FENCING_REQUESTED:
      return InstanceFencingState::FENCED;
    case InstanceFencingState::UNFENCING_REQUESTED:
      return InstanceFencingState::UNFENCED;
    case InstanceFencingState::UNFENCED:
    case InstanceFencingState::FENCED:
      break;
  }
  LOG_FATAL("No executor confirmation is expected in state {}.", ToString(requested));
}

void to_json(nlohmann::json &j, InstanceFencingState const &state) { j = std::string{ToString(state)}; }

void from_json(nlohmann::json const &j, InstanceFencingState &state) {
  auto const value = j.get<std::string>();
  auto const parsed = utils::StringToEnum<InstanceFencingState>(value, kStateMapping);
  if (!parsed) {
    throw InvalidFencingRequest("Unknown instance fencing state '{}'. Allowed values: {}", value,
                                utils::GetAllowedEnumValuesString(kStateMapping));
  }
  state = *parsed;
}

}  // namespace pgfence::fencing
