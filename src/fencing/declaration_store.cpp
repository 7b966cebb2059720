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

#include "fencing/declaration_store.hpp"

#include <utility>

#include "fencing/exceptions.hpp"
#include "utils/logging.hpp"

namespace pgfence::fencing {

auto InMemoryDeclarationStore::Get() const -> VersionedFencingSet {
  auto const [raw, version] = record_.WithLock([](auto const &record) { return std::pair{record.raw, record.version}; });
  return VersionedFencingSet{.fencing_set = raw ? DecodeFencingSet(*raw) : FencingSet{}, .version = version};
}

auto InMemoryDeclarationStore::Set(FencingSet const &fencing_set, uint64_t const expected_version) -> uint64_t {
  auto const new_version = record_.WithLock([&](auto &record) {
    if (record.version != expected_version) {
      throw ConflictError("Fenced instances were modified concurrently, expected version {} but found {}.",
                          expected_version, record.version);
    }
    if (fencing_set.IsEmpty()) {
      record.raw.reset();
    } else {
      record.raw = EncodeFencingSet(fencing_set);
    }
    return ++record.version;
  });

  spdlog::debug("Fenced instances set to {} at version {}.", ToString(fencing_set), new_version);
  Notify(VersionedFencingSet{.fencing_set = fencing_set, .version = new_version});
  return new_version;
}

auto InMemoryDeclarationStore::GetRaw() const -> std::optional<std::string> { return record_->raw; }

}  // namespace pgfence::fencing
