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
#include <optional>
#include <string>

#include "fencing/fencing_set.hpp"
#include "utils/observer.hpp"
#include "utils/synchronized.hpp"

namespace pgfence::fencing {

struct VersionedFencingSet {
  FencingSet fencing_set;
  uint64_t version{0};  // 0 until the key has been written for the first time

  friend bool operator==(VersionedFencingSet const &, VersionedFencingSet const &) = default;
};

// Durable, versioned home of the fenced instances declaration.
//
// Writers follow read-modify-write: Get() returns the version token which must
// be handed back to Set(). Observers are notified after each successful Set().
class DeclarationStore : public utils::Observable<VersionedFencingSet> {
 public:
  DeclarationStore() = default;
  ~DeclarationStore() override = default;

  DeclarationStore(DeclarationStore const &) = delete;
  DeclarationStore &operator=(DeclarationStore const &) = delete;
  DeclarationStore(DeclarationStore &&) = delete;
  DeclarationStore &operator=(DeclarationStore &&) = delete;

  // @throw InvalidFencingRequest if the stored value is malformed.
  virtual auto Get() const -> VersionedFencingSet = 0;

  // Compare-and-swap. An empty explicit set removes the key.
  // @return the new version.
  // @throw ConflictError if the stored version isn't expected_version.
  virtual auto Set(FencingSet const &fencing_set, uint64_t expected_version) -> uint64_t = 0;
};

// Keeps the declaration in memory, e.g. for a controller that receives the key
// from its resource watch.
class InMemoryDeclarationStore final : public DeclarationStore {
 public:
  InMemoryDeclarationStore() = default;

  auto Get() const -> VersionedFencingSet override;
  auto Set(FencingSet const &fencing_set, uint64_t expected_version) -> uint64_t override;

  // Raw key value, std::nullopt when the key is absent.
  auto GetRaw() const -> std::optional<std::string>;

 private:
  struct Record {
    std::optional<std::string> raw;
    uint64_t version{0};
  };

  utils::Synchronized<Record> record_;
};

}  // namespace pgfence::fencing
