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

#include "utils/exceptions.hpp"

namespace pgfence::fencing {

// Optimistic-concurrency collision on the declaration store.
class ConflictError final : public utils::BasicException {
 public:
  explicit ConflictError(std::string_view what) noexcept : BasicException(what) {}

  template <class... Args>
  explicit ConflictError(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : ConflictError(fmt::format(fmt, std::forward<Args>(args)...)) {}

  SPECIALIZE_GET_EXCEPTION_NAME(ConflictError)
};

// Malformed or ambiguous fencing input. Never retried.
class InvalidFencingRequest final : public utils::BasicException {
 public:
  explicit InvalidFencingRequest(std::string_view what) noexcept : BasicException(what) {}

  template <class... Args>
  explicit InvalidFencingRequest(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : InvalidFencingRequest(fmt::format(fmt, std::forward<Args>(args)...)) {}

  SPECIALIZE_GET_EXCEPTION_NAME(InvalidFencingRequest)
};

// The executor couldn't reach or change the target instance in time.
class ExecutionError final : public utils::BasicException {
 public:
  explicit ExecutionError(std::string_view what) noexcept : BasicException(what) {}

  template <class... Args>
  explicit ExecutionError(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : ExecutionError(fmt::format(fmt, std::forward<Args>(args)...)) {}

  SPECIALIZE_GET_EXCEPTION_NAME(ExecutionError)
};

}  // namespace pgfence::fencing
