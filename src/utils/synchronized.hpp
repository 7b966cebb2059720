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

#include <mutex>
#include <utility>

namespace pgfence::utils {

/// Couples an object with the mutex guarding it, so the object can only be
/// reached while the lock is held (influenced by Facebook's Folly).
///
///   Synchronized<std::map<std::string, InstanceRecord>> records_;
///
///   records_->emplace(name, record);              // one-line operations
///
///   records_.WithLock([&](auto &records) {        // multi-line operations
///     auto it = records.find(name);
///     ...
///   });
template <class T, class TMutex = std::mutex>
class Synchronized {
 public:
  template <class... Args>
  explicit Synchronized(Args &&...args) : object_(std::forward<Args>(args)...) {}

  Synchronized(const Synchronized &) = delete;
  Synchronized(Synchronized &&) = delete;
  Synchronized &operator=(const Synchronized &) = delete;
  Synchronized &operator=(Synchronized &&) = delete;
  ~Synchronized() = default;

  template <class TObject>
  class LockedPtr {
   private:
    friend class Synchronized<T, TMutex>;

    LockedPtr(TObject *object_ptr, TMutex *mutex) : object_ptr_(object_ptr), guard_(*mutex) {}

   public:
    TObject *operator->() const { return object_ptr_; }
    TObject &operator*() const { return *object_ptr_; }

   private:
    TObject *object_ptr_;
    std::lock_guard<TMutex> guard_;
  };

  LockedPtr<T> Lock() { return LockedPtr<T>(&object_, &mutex_); }
  LockedPtr<const T> Lock() const { return LockedPtr<const T>(&object_, &mutex_); }

  LockedPtr<T> operator->() { return Lock(); }
  LockedPtr<const T> operator->() const { return Lock(); }

  template <class TCallable>
  decltype(auto) WithLock(TCallable &&callable) {
    return callable(*Lock());
  }

  template <class TCallable>
  decltype(auto) WithLock(TCallable &&callable) const {
    return callable(*Lock());
  }

 private:
  T object_;
  mutable TMutex mutex_;
};

}  // namespace pgfence::utils
