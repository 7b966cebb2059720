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
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json_fwd.hpp>

namespace pgfence::fencing {

// Derived per-instance fencing progress. The machine is cyclic:
//
//   Unfenced -> FencingRequested -> Fenced -> UnfencingRequested -> Unfenced
//
// FencingRequested and UnfencingRequested may also reverse into each other when
// the declaration changes before the executor confirms.
enum class InstanceFencingState : uint8_t { UNFENCED, FENCING_REQUESTED, FENCED, UNFENCING_REQUESTED };

auto ToString(InstanceFencingState state) -> std::string_view;

// Both requested states are "in progress" and visible as not converged.
auto IsInProgress(InstanceFencingState state) -> bool;

// True while the instance must reject client connections and its role is frozen.
auto IsFencingInEffect(InstanceFencingState state) -> bool;

// The state that follows a confirmed executor call.
auto ConfirmedState(InstanceFencingState requested) -> InstanceFencingState;

void to_json(nlohmann::json &j, InstanceFencingState const &state);
void from_json(nlohmann::json const &j, InstanceFencingState &state);

}  // namespace pgfence::fencing

template <>
struct fmt::formatter<pgfence::fencing::InstanceFencingState> : fmt::formatter<std::string_view> {
  auto format(pgfence::fencing::InstanceFencingState state, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(pgfence::fencing::ToString(state), ctx);
  }
};
