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

#include "fencing/fencing_commands.hpp"

#include "fencing/exceptions.hpp"
#include "utils/exponential_backoff.hpp"
#include "utils/logging.hpp"

namespace pgfence::fencing {

auto ApplyFencingOn(FencingSet const &current, std::string_view target) -> FencingSet {
  if (target == kFenceAllInstances) return FencingSet::FenceAll();

  ValidateInstanceName(target);
  if (current.IsAll()) {
    throw InvalidFencingRequest("Cannot fence instance {} because all instances are already fenced.", target);
  }
  return current.With(target);
}

auto ApplyFencingOff(FencingSet const &current, std::string_view target) -> FencingSet {
  if (target == kFenceAllInstances) return FencingSet{};

  ValidateInstanceName(target);
  if (current.IsAll()) {
    throw InvalidFencingRequest(
        "Cannot unfence instance {} while all instances are fenced, unfence all of them with '{}' instead.", target,
        kFenceAllInstances);
  }
  return current.Without(target);
}

FencingCommands::FencingCommands(DeclarationStore &store, FencingCommandConfig config)
    : store_(&store), config_(config) {
  PGF_ASSERT(config_.max_conflict_retries > 0, "At least one attempt is needed to update fenced instances.");
}

auto FencingCommands::FencingOn(std::string_view target) -> VersionedFencingSet {
  return Update(fmt::format("fencing on {}", target),
                [target](FencingSet const &current) { return ApplyFencingOn(current, target); });
}

auto FencingCommands::FencingOff(std::string_view target) -> VersionedFencingSet {
  return Update(fmt::format("fencing off {}", target),
                [target](FencingSet const &current) { return ApplyFencingOff(current, target); });
}

auto FencingCommands::Annotate(std::string_view fenced_instances_json) -> VersionedFencingSet {
  auto desired = DecodeFencingSet(fenced_instances_json);
  return Update("annotate", [desired = std::move(desired)](FencingSet const & /*current*/) { return desired; });
}

auto FencingCommands::Update(std::string_view operation,
                             std::function<FencingSet(FencingSet const &)> const &compute) -> VersionedFencingSet {
  utils::ExponentialBackoff backoff{config_.conflict_backoff_initial, config_.conflict_backoff_max};

  for (uint32_t attempt = 1;; ++attempt) {
    auto const current = store_->Get();
    auto desired = compute(current.fencing_set);
    if (desired == current.fencing_set) {
      spdlog::debug("{}: fenced instances already {}, nothing to write.", operation, ToString(desired));
      return current;
    }

    try {
      auto const version = store_->Set(desired, current.version);
      spdlog::info("{}: fenced instances changed from {} to {}.", operation, ToString(current.fencing_set),
                   ToString(desired));
      return VersionedFencingSet{.fencing_set = std::move(desired), .version = version};
    } catch (ConflictError const &e) {
      if (attempt >= config_.max_conflict_retries) {
        spdlog::warn("{}: giving up after {} conflicting attempts.", operation, attempt);
        throw ConflictError("{}: fenced instances kept changing concurrently, gave up after {} attempts. {}",
                            operation, attempt, e.what());
      }
      spdlog::debug("{}: attempt {} conflicted, retrying. {}", operation, attempt, e.what());
    }
    backoff.wait();
  }
}

}  // namespace pgfence::fencing
