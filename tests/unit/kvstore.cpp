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


#include <unistd.h>

#include <gtest/gtest.h>

#include "kvstore/kvstore.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;

class KVStore : public ::testing::Test {
 protected:
  void SetUp() override { pgfence::utils::EnsureDir(test_folder_); }

  void TearDown() override { fs::remove_all(test_folder_); }

  fs::path test_folder_{fs::temp_directory_path() /
                        ("unit_kvstore_test_" + std::to_string(static_cast<int>(getpid())))};
};

TEST_F(KVStore, PutGet) {
  pgfence::kvstore::KVStore kvstore(test_folder_ / "PutGet");
  ASSERT_TRUE(kvstore.Put("key", "value"));
  ASSERT_EQ(kvstore.Get("key").value(), "value");
}

TEST_F(KVStore, GetMissing) {
  pgfence::kvstore::KVStore kvstore(test_folder_ / "GetMissing");
  ASSERT_FALSE(kvstore.Get("key").has_value());
}

TEST_F(KVStore, PutMultipleGet) {
  pgfence::kvstore::KVStore kvstore(test_folder_ / "PutMultipleGet");
  ASSERT_TRUE(kvstore.PutMultiple({{"key1", "value1"}, {"key2", "value2"}}));
  ASSERT_EQ(kvstore.Get("key1").value(), "value1");
  ASSERT_EQ(kvstore.Get("key2").value(), "value2");
}

TEST_F(KVStore, PutGetDeleteGet) {
  pgfence::kvstore::KVStore kvstore(test_folder_ / "PutGetDeleteGet");
  ASSERT_TRUE(kvstore.Put("key", "value"));
  ASSERT_EQ(kvstore.Get("key").value(), "value");
  ASSERT_TRUE(kvstore.Delete("key"));
  ASSERT_FALSE(static_cast<bool>(kvstore.Get("key")));
  // Deleting a missing key isn't an error.
  ASSERT_TRUE(kvstore.Delete("key"));
}

TEST_F(KVStore, PutMultipleGetPutAndDeleteMultipleGet) {
  pgfence::kvstore::KVStore kvstore(test_folder_ / "PutMultipleGetPutAndDeleteMultipleGet");
  ASSERT_TRUE(kvstore.PutMultiple({{"key1", "value1"}, {"key2", "value2"}}));
  ASSERT_EQ(kvstore.Get("key1").value(), "value1");
  ASSERT_EQ(kvstore.Get("key2").value(), "value2");
  ASSERT_TRUE(kvstore.PutAndDeleteMultiple({{"key3", "value3"}}, {"key1", "key2"}));
  ASSERT_FALSE(static_cast<bool>(kvstore.Get("key1")));
  ASSERT_FALSE(static_cast<bool>(kvstore.Get("key2")));
  ASSERT_EQ(kvstore.Get("key3").value(), "value3");
}

TEST_F(KVStore, Durability) {
  {
    pgfence::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_TRUE(kvstore.Put("key", "value"));
  }
  {
    pgfence::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_EQ(kvstore.Get("key").value(), "value");
  }
}

TEST_F(KVStore, MoveKeepsDatabaseOpen) {
  pgfence::kvstore::KVStore kvstore(test_folder_ / "MoveKeepsDatabaseOpen");
  ASSERT_TRUE(kvstore.Put("key", "value"));
  pgfence::kvstore::KVStore moved(std::move(kvstore));
  ASSERT_EQ(moved.Get("key").value(), "value");
}
