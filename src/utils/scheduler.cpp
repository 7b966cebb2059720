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

#include "utils/scheduler.hpp"

#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace pgfence::utils {

void Scheduler::Run_(const std::string &service_name, std::chrono::milliseconds pause,
                     const std::function<void()> &f) {
  PGF_ASSERT(pause > std::chrono::milliseconds(0), "Pause is invalid. Expected > 0, got {}.", pause.count());
  // stop any running thread
  Stop();

  thread_ = std::jthread([this, pause, f = f, service_name = service_name](std::stop_token token) mutable {
    ThreadRun(std::move(service_name), pause, std::move(f), token);
  });
}

// Checking stop_possible() is necessary because otherwise calling IsRunning
// on a non-started Scheduler would return true.
bool Scheduler::IsRunning() {
  const auto token = thread_.get_stop_token();
  return token.stop_possible() && !token.stop_requested();
}

void Scheduler::SpinOnce() {
  {
    auto lk = std::unique_lock{mutex_};
    spin_once_ = true;
  }
  condition_variable_.notify_one();
}

void Scheduler::ThreadRun(std::string service_name, std::chrono::milliseconds pause, std::function<void()> f,
                          std::stop_token token) {
  ThreadSetName(service_name.size() > GetMaxThreadNameSize() ? service_name.substr(0, GetMaxThreadNameSize())
                                                             : service_name);

  auto next_execution = std::chrono::steady_clock::now() + pause;
  while (true) {
    {
      auto lk = std::unique_lock{mutex_};
      condition_variable_.wait_until(lk, token, next_execution, [&] { return spin_once_; });
      if (is_paused_) {
        condition_variable_.wait(lk, token, [&] { return !is_paused_ || spin_once_; });
      }
      if (token.stop_requested()) break;
      spin_once_ = false;
    }

    f();

    // If multiple periods are missed, execute once and realign to the period.
    const auto now = std::chrono::steady_clock::now();
    next_execution += pause;
    if (next_execution < now) next_execution = now + pause;
  }
}

// Concurrent threads may request stopping the scheduler. In that case only one of them will
// actually stop the scheduler, the other one won't. We need to know which one is the successful
// one so that we don't try to join thread concurrently since this could cause undefined behavior.
void Scheduler::Stop() {
  if (thread_.request_stop()) {
    {
      // Lock needs to be held when modifying cv even if atomic
      auto lk = std::unique_lock{mutex_};
      is_paused_ = false;
    }
    condition_variable_.notify_one();
    if (thread_.joinable()) thread_.join();
  }
}

// Sets is_paused_ to true.
void Scheduler::Pause() {
  auto lk = std::unique_lock{mutex_};
  is_paused_ = true;
}

// Sets is_paused_ to false and notifies thread
void Scheduler::Resume() {
  {
    auto lk = std::unique_lock{mutex_};
    if (!is_paused_) return;
    is_paused_ = false;
  }
  condition_variable_.notify_one();
}

}  // namespace pgfence::utils
