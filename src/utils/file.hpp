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

/**
 * @file
 *
 * Filesystem helpers shared by the persistent components.
 */
#pragma once

#include <filesystem>

namespace pgfence::utils {

/// Ensures that the given directory either exists or is created. Returns true
/// if the directory exists after the call, false on any error.
bool EnsureDir(const std::filesystem::path &dir) noexcept;

/// Deletes the directory and everything inside it. Returns true on success.
bool DeleteDir(const std::filesystem::path &dir) noexcept;

}  // namespace pgfence::utils
