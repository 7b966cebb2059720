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

#include <chrono>
#include <cstdint>
#include <string>

namespace pgfence::fencing {

struct FencingCommandConfig {
  // Attempts in total, the first one included.
  uint32_t max_conflict_retries{5};
  std::chrono::milliseconds conflict_backoff_initial{50};
  std::chrono::milliseconds conflict_backoff_max{1000};
};

struct ExecutorConfig {
  std::chrono::milliseconds timeout{5000};
};

struct ReconcilerConfig {
  std::string cluster_name;
  uint32_t workers{4};
  // Periodic resync; the loop is also triggered by every declaration change.
  std::chrono::milliseconds resync_interval{10000};
  std::chrono::milliseconds retry_backoff_initial{500};
  std::chrono::milliseconds retry_backoff_max{30000};
};

struct FencingConfig {
  FencingCommandConfig commands;
  ExecutorConfig executor;
  ReconcilerConfig reconciler;
};

}  // namespace pgfence::fencing
