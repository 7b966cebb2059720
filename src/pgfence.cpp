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


#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "gflags/gflags.h"

#include "fencing/exceptions.hpp"
#include "fencing/fencing_commands.hpp"
#include "fencing/kvstore_declaration_store.hpp"
#include "flags/fencing.hpp"
#include "flags/general.hpp"
#include "flags/log_level.hpp"
#include "kvstore/kvstore.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInvalidRequest = 2;
constexpr int kExitConflict = 3;
constexpr int kExitStorage = 4;

constexpr std::string_view kUsage =
    "Administrative fencing of PostgreSQL cluster instances.\n\n"
    "  pgfence fencing on <instance|*>    fence one instance or every instance\n"
    "  pgfence fencing off <instance|*>   lift fencing from one instance or every instance\n"
    "  pgfence annotate '<json array>'    replace the declaration, e.g. '[\"pg-1\"]' or '[\"*\"]'\n"
    "  pgfence show                       print the stored declaration";

void PrintDeclaration(pgfence::fencing::VersionedFencingSet const &declaration) {
  std::cout << fmt::format("{} (version {})", pgfence::fencing::EncodeFencingSet(declaration.fencing_set),
                           declaration.version)
            << std::endl;
}

auto Run(std::vector<std::string_view> const &args) -> int {
  using namespace pgfence;

  if (args.empty()) return kExitUsage;

  fencing::KVStoreDeclarationStore store(std::filesystem::path(FLAGS_data_directory) / "fencing", FLAGS_cluster);
  auto const config = flags::FencingConfigFromFlags();
  fencing::FencingCommands commands(store, config.commands);

  if (args[0] == "show" && args.size() == 1) {
    auto const raw = store.GetRaw();
    std::cout << fmt::format("{}: {} (version {})", fencing::kFencedInstancesKey, raw.value_or("[]"),
                             store.Get().version)
              << std::endl;
    return kExitOk;
  }
  if (args[0] == "annotate" && args.size() == 2) {
    PrintDeclaration(commands.Annotate(args[1]));
    return kExitOk;
  }
  if (args[0] == "fencing" && args.size() == 3) {
    if (args[1] == "on") {
      PrintDeclaration(commands.FencingOn(args[2]));
      return kExitOk;
    }
    if (args[1] == "off") {
      PrintDeclaration(commands.FencingOff(args[2]));
      return kExitOk;
    }
  }
  return kExitUsage;
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage(std::string{kUsage});
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  pgfence::flags::InitializeLogger();

  std::vector<std::string_view> args(argv + 1, argv + argc);
  try {
    auto const exit_code = Run(args);
    if (exit_code == kExitUsage) {
      std::cerr << kUsage << std::endl;
    }
    return exit_code;
  } catch (pgfence::fencing::InvalidFencingRequest const &e) {
    std::cerr << "Invalid fencing request: " << e.what() << std::endl;
    return kExitInvalidRequest;
  } catch (pgfence::fencing::ConflictError const &e) {
    std::cerr << "Fencing declaration is changing concurrently: " << e.what() << std::endl;
    return kExitConflict;
  } catch (pgfence::kvstore::KVStoreError const &e) {
    spdlog::error("Storage failure in {}: {}", FLAGS_data_directory, e.what());
    std::cerr << "Storage error: " << e.what() << std::endl;
    return kExitStorage;
  }
}
