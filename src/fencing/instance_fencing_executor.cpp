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

#include "fencing/instance_fencing_executor.hpp"

#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "fencing/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace pgfence::fencing {

InstanceFencingExecutor::InstanceFencingExecutor(InstanceControl &control, RoleProvider const &roles,
                                                 ExecutorConfig config)
    : control_(&control), roles_(&roles), config_(config) {}

InstanceFencingExecutor::~InstanceFencingExecutor() {
  // Abandoned calls still release their slot when they return, so they are joined outside the lock.
  std::vector<std::jthread> threads;
  slots_.WithLock([&](auto &slots) {
    for (auto &[name, slot] : slots) {
      if (slot.thread.joinable()) threads.push_back(std::move(slot.thread));
    }
  });
}

template <typename TResult>
auto InstanceFencingExecutor::CallWithTimeout(std::string_view instance_name, std::string_view what,
                                              std::function<TResult()> call) -> TResult {
  // The promise is shared with the call thread so an abandoned call can still complete safely.
  auto promise = std::make_shared<std::promise<TResult>>();
  auto future = promise->get_future();

  slots_.WithLock([&](auto &slots) {
    auto &slot = slots.try_emplace(std::string{instance_name}).first->second;
    if (slot.busy) {
      throw ExecutionError("{} on instance {} can't start, an earlier {} call didn't return yet.", what,
                           instance_name, slot.running);
    }
    // The previous call already released the slot, its thread is done or about to be.
    if (slot.thread.joinable()) slot.thread.join();

    slot.busy = true;
    slot.running = std::string{what};
    slot.thread = std::jthread([this, promise, name = std::string{instance_name}, call = std::move(call)] {
      utils::ThreadSetName("fence_call");
      std::optional<TResult> result;
      std::exception_ptr error;
      try {
        result.emplace(call());
      } catch (...) {
        error = std::current_exception();
      }
      // Released before the result is published so the caller's next call finds the slot free.
      slots_.WithLock([&](auto &slots) { slots.find(name)->second.busy = false; });
      if (error) {
        promise->set_exception(error);
      } else {
        promise->set_value(std::move(*result));
      }
    });
  });

  if (future.wait_for(config_.timeout) != std::future_status::ready) {
    throw ExecutionError("{} on instance {} didn't finish within {}ms.", what, instance_name,
                         config_.timeout.count());
  }
  try {
    return future.get();
  } catch (ExecutionError const &) {
    throw;
  } catch (std::exception const &e) {
    throw ExecutionError("{} on instance {} failed: {}", what, instance_name, e.what());
  }
}

void InstanceFencingExecutor::ExpectAcceptingConnections(std::string_view instance_name, bool const expected) {
  auto const accepting = CallWithTimeout<std::optional<bool>>(
      instance_name, "Connection probe",
      [this, name = std::string{instance_name}] { return control_->ProbeAcceptingConnections(name); });
  if (!accepting.has_value()) {
    throw ExecutionError("Instance {} is unreachable.", instance_name);
  }
  if (*accepting != expected) {
    throw ExecutionError("Instance {} is still {} client connections.", instance_name,
                         expected ? "refusing" : "accepting");
  }
}

void InstanceFencingExecutor::Fence(std::string_view instance_name) {
  spdlog::debug("Fencing instance {}.", instance_name);
  auto const stopped = CallWithTimeout<bool>(
      instance_name, "Stopping client connections",
      [this, name = std::string{instance_name}] { return control_->StopAcceptingConnections(name); });
  if (!stopped) {
    throw ExecutionError("Couldn't stop client connections on instance {}.", instance_name);
  }
  ExpectAcceptingConnections(instance_name, false);
  spdlog::info("Instance {} is fenced.", instance_name);
}

void InstanceFencingExecutor::Unfence(std::string_view instance_name) {
  spdlog::debug("Unfencing instance {}.", instance_name);
  auto const assignment = roles_->CurrentRoleAssignment();
  if (!assignment) {
    throw ExecutionError("Couldn't determine the primary while unfencing instance {}.", instance_name);
  }

  auto const started = CallWithTimeout<bool>(
      instance_name, "Starting client connections",
      [this, name = std::string{instance_name}] { return control_->StartAcceptingConnections(name); });
  if (!started) {
    throw ExecutionError("Couldn't start client connections on instance {}.", instance_name);
  }

  if (assignment->RoleOf(instance_name) == ClusterRole::REPLICA) {
    auto const resumed = CallWithTimeout<bool>(
        instance_name, "Resuming streaming",
        [this, name = std::string{instance_name}, upstream = assignment->primary] {
          return control_->ResumeStreaming(name, upstream);
        });
    if (!resumed) {
      throw ExecutionError("Replica {} couldn't resume streaming from primary {}.", instance_name,
                           assignment->primary);
    }
  }

  ExpectAcceptingConnections(instance_name, true);
  spdlog::info("Instance {} is unfenced.", instance_name);
}

}  // namespace pgfence::fencing
