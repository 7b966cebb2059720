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


#include "flags/fencing.hpp"

#include <chrono>
#include <cstdint>

#include "flags/general.hpp"
#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_max_conflict_retries, 5,
                        "Attempts an administrative fencing command makes when the declaration changes concurrently.",
                        FLAG_IN_RANGE(1, 100));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_conflict_backoff_initial_ms, 50,
                        "Initial delay between two attempts of a conflicting fencing command.",
                        FLAG_IN_RANGE(1, 60000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_conflict_backoff_max_ms, 1000,
                        "Maximum delay between two attempts of a conflicting fencing command.",
                        FLAG_IN_RANGE(1, 600000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_executor_timeout_ms, 5000,
                        "Time after which a call to an instance is abandoned and the fencing attempt fails.",
                        FLAG_IN_RANGE(1, 600000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_reconciler_workers, 4, "Instances the reconciler fences or unfences in parallel.",
                        FLAG_IN_RANGE(1, 256));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_resync_interval_ms, 10000,
                        "Interval of the periodic reconciliation pass, run in addition to change driven passes.",
                        FLAG_IN_RANGE(100, 3600000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_retry_backoff_initial_ms, 500,
                        "Initial delay before an instance whose fencing attempt failed is retried.",
                        FLAG_IN_RANGE(1, 600000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(fencing_retry_backoff_max_ms, 30000,
                        "Maximum delay before an instance whose fencing attempt failed is retried.",
                        FLAG_IN_RANGE(1, 3600000));

auto pgfence::flags::FencingConfigFromFlags() -> fencing::FencingConfig {
  using std::chrono::milliseconds;
  auto const ms = [](uint64_t value) { return milliseconds(static_cast<milliseconds::rep>(value)); };

  fencing::FencingConfig config;
  config.commands.max_conflict_retries = static_cast<uint32_t>(FLAGS_fencing_max_conflict_retries);
  config.commands.conflict_backoff_initial = ms(FLAGS_fencing_conflict_backoff_initial_ms);
  config.commands.conflict_backoff_max = ms(FLAGS_fencing_conflict_backoff_max_ms);

  config.executor.timeout = ms(FLAGS_fencing_executor_timeout_ms);

  config.reconciler.cluster_name = FLAGS_cluster;
  config.reconciler.workers = static_cast<uint32_t>(FLAGS_fencing_reconciler_workers);
  config.reconciler.resync_interval = ms(FLAGS_fencing_resync_interval_ms);
  config.reconciler.retry_backoff_initial = ms(FLAGS_fencing_retry_backoff_initial_ms);
  config.reconciler.retry_backoff_max = ms(FLAGS_fencing_retry_backoff_max_ms);
  return config;
}
