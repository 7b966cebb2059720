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


#include "flags/log_level.hpp"

#include <array>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "spdlog/common.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(also_log_to_stderr, false, "Log messages go to stderr in addition to logfiles.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "Path to where the log should be stored.");

namespace {

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string log_level_help_string = fmt::format("Minimum log level. Allowed values: {}",
                                                      pgfence::utils::GetAllowedEnumValuesString(log_level_mappings));

// 5 weeks * 7 days
inline constexpr auto log_retention_count = 35;

spdlog::level::level_enum ParseLogLevel() {
  const auto log_level = pgfence::flags::LogLevelToEnum(FLAGS_log_level);
  PGF_ASSERT(log_level, "Invalid log level {}", FLAGS_log_level);
  return *log_level;
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", log_level_help_string.c_str(),
                        { return pgfence::flags::ValidLogLevel(value); });

bool pgfence::flags::ValidLogLevel(std::string_view value) {
  if (value.empty()) {
    std::cout << "Log level cannot be empty." << std::endl;
    return false;
  }
  if (!LogLevelToEnum(value)) {
    std::cout << "Invalid value for log level. Allowed values: "
              << pgfence::utils::GetAllowedEnumValuesString(log_level_mappings) << std::endl;
    return false;
  }
  return true;
}

std::optional<spdlog::level::level_enum> pgfence::flags::LogLevelToEnum(std::string_view value) {
  return pgfence::utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

void pgfence::flags::InitializeLogger() {
  std::vector<spdlog::sink_ptr> sinks;

  // The stderr sink stays at the front so LogToStderr can toggle it by level.
  sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  sinks.back()->set_level(spdlog::level::off);

  if (!FLAGS_log_file.empty()) {
    time_t current_time{0};
    time(&current_time);
    struct tm local_time {};
    localtime_r(&current_time, &local_time);

    sinks.emplace_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
        FLAGS_log_file, local_time.tm_hour, local_time.tm_min, false, log_retention_count));
  }

  const auto log_level = ParseLogLevel();
  auto logger = std::make_shared<spdlog::logger>("pgfence_log", sinks.begin(), sinks.end());
  logger->set_level(log_level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));

  // Without a log file stderr is the only destination.
  if (FLAGS_also_log_to_stderr || FLAGS_log_file.empty()) {
    LogToStderr(log_level);
  }
}

// NOTE: default_logger is not thread-safe and shouldn't be replaced once the reconciler runs.
void pgfence::flags::LogToStderr(spdlog::level::level_enum log_level) {
  auto sink = spdlog::default_logger()->sinks().front();
  sink->set_level(log_level);
}
