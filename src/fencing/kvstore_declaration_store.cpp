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

#include "fencing/kvstore_declaration_store.hpp"

#include <charconv>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "fencing/exceptions.hpp"
#include "utils/logging.hpp"

namespace pgfence::fencing {

namespace {
constexpr std::string_view kValueKeySuffix{"/fencedInstances"};
constexpr std::string_view kVersionKeySuffix{"/fencedInstances.version"};
}  // namespace

KVStoreDeclarationStore::KVStoreDeclarationStore(std::filesystem::path const &storage, std::string cluster_name)
    : cluster_name_(std::move(cluster_name)),
      value_key_(fmt::format("{}{}", cluster_name_, kValueKeySuffix)),
      version_key_(fmt::format("{}{}", cluster_name_, kVersionKeySuffix)),
      kvstore_(storage) {
  spdlog::info("Fenced instances of cluster {} are stored at {}.", cluster_name_, storage.string());
}

auto KVStoreDeclarationStore::ReadVersion() const -> uint64_t {
  auto const maybe_version = kvstore_.Get(version_key_);
  if (!maybe_version) return 0;

  uint64_t version{0};
  auto const *begin = maybe_version->data();
  auto const *end = begin + maybe_version->size();
  if (auto const [ptr, ec] = std::from_chars(begin, end, version); ec != std::errc{} || ptr != end) {
    throw kvstore::KVStoreError("Corrupted version '{}' stored under {}.", *maybe_version, version_key_);
  }
  return version;
}

auto KVStoreDeclarationStore::Get() const -> VersionedFencingSet {
  auto guard = std::lock_guard{cas_lock_};
  auto const raw = kvstore_.Get(value_key_);
  return VersionedFencingSet{.fencing_set = raw ? DecodeFencingSet(*raw) : FencingSet{}, .version = ReadVersion()};
}

auto KVStoreDeclarationStore::Set(FencingSet const &fencing_set, uint64_t const expected_version) -> uint64_t {
  uint64_t new_version{0};
  {
    auto guard = std::lock_guard{cas_lock_};
    auto const current_version = ReadVersion();
    if (current_version != expected_version) {
      throw ConflictError("Fenced instances of cluster {} were modified concurrently, expected version {} but found {}.",
                          cluster_name_, expected_version, current_version);
    }
    new_version = current_version + 1;

    std::map<std::string, std::string> items{{version_key_, std::to_string(new_version)}};
    std::vector<std::string> deleted_keys;
    if (fencing_set.IsEmpty()) {
      deleted_keys.push_back(value_key_);
    } else {
      items.emplace(value_key_, EncodeFencingSet(fencing_set));
    }
    if (!kvstore_.PutAndDeleteMultiple(items, deleted_keys)) {
      throw kvstore::KVStoreError("Couldn't persist fenced instances of cluster {}.", cluster_name_);
    }
  }

  spdlog::debug("Fenced instances of cluster {} set to {} at version {}.", cluster_name_, ToString(fencing_set),
                new_version);
  Notify(VersionedFencingSet{.fencing_set = fencing_set, .version = new_version});
  return new_version;
}

auto KVStoreDeclarationStore::GetRaw() const -> std::optional<std::string> {
  auto guard = std::lock_guard{cas_lock_};
  return kvstore_.Get(value_key_);
}

}  // namespace pgfence::fencing
