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

#include <filesystem>
#include <mutex>
#include <string>

#include "fencing/declaration_store.hpp"
#include "kvstore/kvstore.hpp"

namespace pgfence::fencing {

// Declaration store persisted in RocksDB. The value and its version live under
// "<cluster>/fencedInstances" and "<cluster>/fencedInstances.version" and are
// always written together in one batch.
class KVStoreDeclarationStore final : public DeclarationStore {
 public:
  // @throw kvstore::KVStoreError if the storage can't be opened.
  KVStoreDeclarationStore(std::filesystem::path const &storage, std::string cluster_name);

  auto Get() const -> VersionedFencingSet override;

  // @throw kvstore::KVStoreError if the batch couldn't be written.
  auto Set(FencingSet const &fencing_set, uint64_t expected_version) -> uint64_t override;

  auto GetRaw() const -> std::optional<std::string>;

  auto ClusterName() const -> std::string const & { return cluster_name_; }

 private:
  auto ReadVersion() const -> uint64_t;

  std::string cluster_name_;
  std::string value_key_;
  std::string version_key_;
  // Serializes compare-and-swap; RocksDB lets a single process open the database.
  mutable std::mutex cas_lock_;
  kvstore::KVStore kvstore_;
};

}  // namespace pgfence::fencing
