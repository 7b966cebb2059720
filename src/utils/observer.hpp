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

#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace pgfence::utils {

template <typename T>
class Observer {
 public:
  virtual ~Observer() = default;
  virtual void Update(const T &) = 0;
};

template <typename T>
class Observable {
 public:
  virtual ~Observable() = default;

  void Attach(std::shared_ptr<Observer<T>> observer) {
    auto l = std::unique_lock{mtx_};
    observers_.insert(std::move(observer));
  }

  void Detach(const std::shared_ptr<Observer<T>> &observer) {
    auto l = std::unique_lock{mtx_};
    observers_.erase(observer);
  }

 protected:
  // Observers are copied out so an Update may Attach/Detach without deadlocking.
  void Notify(const T &value) {
    std::vector<std::shared_ptr<Observer<T>>> observers;
    {
      auto l = std::unique_lock{mtx_};
      observers.assign(observers_.begin(), observers_.end());
    }
    for (const auto &observer : observers) {
      observer->Update(value);
    }
  }

 private:
  std::set<std::shared_ptr<Observer<T>>> observers_;
  mutable std::mutex mtx_;
};

}  // namespace pgfence::utils
