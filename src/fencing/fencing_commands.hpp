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
#include <string_view>

#include "fencing/config.hpp"
#include "fencing/declaration_store.hpp"

namespace pgfence::fencing {

// Computes the set after "fencing on <target>".
// @throw InvalidFencingRequest
auto ApplyFencingOn(FencingSet const &current, std::string_view target) -> FencingSet;

// Computes the set after "fencing off <target>".
// @throw InvalidFencingRequest
auto ApplyFencingOff(FencingSet const &current, std::string_view target) -> FencingSet;

// Entry points that mutate the declaration. Every write is a read-modify-write
// against the store, retried on ConflictError with exponential backoff until
// the configured number of attempts is used up.
class FencingCommands {
 public:
  FencingCommands(DeclarationStore &store, FencingCommandConfig config);

  // @throw InvalidFencingRequest, ConflictError
  auto FencingOn(std::string_view target) -> VersionedFencingSet;
  auto FencingOff(std::string_view target) -> VersionedFencingSet;

  // Replaces the declaration with the given JSON array. Last writer wins.
  // @throw InvalidFencingRequest, ConflictError
  auto Annotate(std::string_view fenced_instances_json) -> VersionedFencingSet;

 private:
  auto Update(std::string_view operation, std::function<FencingSet(FencingSet const &)> const &compute)
      -> VersionedFencingSet;

  DeclarationStore *store_;
  FencingCommandConfig config_;
};

}  // namespace pgfence::fencing
