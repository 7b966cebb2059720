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
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace pgfence::utils {

/**
 * Class used to run scheduled function execution.
 */
class Scheduler {
 public:
  Scheduler() = default;

  /**
   * @param pause - Duration between two function executions. If function is
   * still running when it should be ran again, it will run right after it
   * finishes its previous run.
   * @param f - Function
   * @throw std::system_error if thread could not be started.
   */
  template <typename TRep, typename TPeriod>
  void Run(const std::string &service_name, const std::chrono::duration<TRep, TPeriod> &pause,
           const std::function<void()> &f) {
    Run_(service_name, std::chrono::duration_cast<std::chrono::milliseconds>(pause), f);
  }

  void Resume();

  void Pause();

  void Stop();

  bool IsRunning();

  /// Wakes the thread and executes the function right away instead of waiting for the period to pass.
  void SpinOnce();

  Scheduler(const Scheduler &) = delete;
  Scheduler(Scheduler &&) = delete;
  Scheduler &operator=(const Scheduler &) = delete;
  Scheduler &operator=(Scheduler &&) = delete;

  ~Scheduler() { Stop(); }

 private:
  void Run_(const std::string &service_name, std::chrono::milliseconds pause, const std::function<void()> &f);

  void ThreadRun(std::string service_name, std::chrono::milliseconds pause, std::function<void()> f,
                 std::stop_token token);

  /**
   * Variable is true for a single cycle when the function should run without waiting.
   */
  bool spin_once_ = false;

  /**
   * Variable is true when thread is paused.
   */
  bool is_paused_ = false;

  /**
   * Mutex used to synchronize threads using condition variable.
   */
  std::mutex mutex_;

  /**
   * Condition variable is used to stop waiting until the end of the
   * time interval if destructor is called.
   */
  std::condition_variable_any condition_variable_;

  /**
   * Thread which runs function.
   */
  std::jthread thread_;
};

}  // namespace pgfence::utils
