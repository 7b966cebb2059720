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


#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fencing/exceptions.hpp"
#include "fencing/fencing_set.hpp"

using pgfence::fencing::DecodeFencingSet;
using pgfence::fencing::EncodeFencingSet;
using pgfence::fencing::FencingSet;
using pgfence::fencing::InvalidFencingRequest;

TEST(FencingSet, EmptyByDefault) {
  FencingSet fencing_set;
  EXPECT_TRUE(fencing_set.IsEmpty());
  EXPECT_FALSE(fencing_set.IsAll());
  EXPECT_FALSE(fencing_set.Contains("pg-1"));
  EXPECT_EQ(EncodeFencingSet(fencing_set), "[]");
}

TEST(FencingSet, WildcardContainsEveryInstance) {
  auto const fencing_set = FencingSet::FenceAll();
  EXPECT_TRUE(fencing_set.IsAll());
  EXPECT_FALSE(fencing_set.IsEmpty());
  EXPECT_EQ(fencing_set.ExplicitNames(), nullptr);
  EXPECT_TRUE(fencing_set.Contains("pg-1"));
  EXPECT_TRUE(fencing_set.Contains("added-later"));
  EXPECT_EQ(EncodeFencingSet(fencing_set), R"(["*"])");
}

TEST(FencingSet, ResolveAgainstLiveInstances) {
  std::vector<std::string> const live{"pg-1", "pg-2", "pg-3"};

  EXPECT_EQ(FencingSet::FenceAll().Resolve(live), (FencingSet::Names{"pg-1", "pg-2", "pg-3"}));
  // Declared names that aren't live are ignored.
  EXPECT_EQ((FencingSet{"pg-2", "pg-9"}.Resolve(live)), (FencingSet::Names{"pg-2"}));
  EXPECT_TRUE(FencingSet{}.Resolve(live).empty());
}

TEST(FencingSet, WithAndWithout) {
  auto const fencing_set = FencingSet{}.With("pg-2").With("pg-1").With("pg-2");
  EXPECT_EQ(fencing_set, (FencingSet{"pg-1", "pg-2"}));
  EXPECT_EQ(fencing_set.Without("pg-1"), (FencingSet{"pg-2"}));
  EXPECT_EQ(fencing_set.Without("missing"), fencing_set);
  EXPECT_TRUE(fencing_set.Without("pg-1").Without("pg-2").IsEmpty());

  EXPECT_TRUE(FencingSet::FenceAll().With("pg-1").IsAll());
  EXPECT_TRUE(FencingSet::FenceAll().Without("pg-1").IsAll());
}

TEST(FencingSet, EncodesNamesSorted) {
  EXPECT_EQ(EncodeFencingSet(FencingSet{"pg-3", "pg-1", "pg-2"}), R"(["pg-1","pg-2","pg-3"])");
}

TEST(FencingSet, Decode) {
  EXPECT_TRUE(DecodeFencingSet("").IsEmpty());
  EXPECT_TRUE(DecodeFencingSet("  \n").IsEmpty());
  EXPECT_TRUE(DecodeFencingSet("[]").IsEmpty());
  EXPECT_TRUE(DecodeFencingSet(R"(["*"])").IsAll());
  EXPECT_EQ(DecodeFencingSet(R"(["pg-2", "pg-1", "pg-2"])"), (FencingSet{"pg-1", "pg-2"}));
}

TEST(FencingSet, DecodeRejectsMalformedValues) {
  EXPECT_THROW(DecodeFencingSet("pg-1"), InvalidFencingRequest);
  EXPECT_THROW(DecodeFencingSet(R"(["pg-1")"), InvalidFencingRequest);
  EXPECT_THROW(DecodeFencingSet(R"({"name": "pg-1"})"), InvalidFencingRequest);
  EXPECT_THROW(DecodeFencingSet(R"("*")"), InvalidFencingRequest);
  EXPECT_THROW(DecodeFencingSet("[1, 2]"), InvalidFencingRequest);
  EXPECT_THROW(DecodeFencingSet(R"([""])"), InvalidFencingRequest);
  EXPECT_THROW(DecodeFencingSet(R"(["pg*"])"), InvalidFencingRequest);
  EXPECT_THROW(DecodeFencingSet(R"(["pg 1"])"), InvalidFencingRequest);
}

TEST(FencingSet, WildcardCannotBeMixedWithNames) {
  EXPECT_THROW(DecodeFencingSet(R"(["*", "pg-1"])"), InvalidFencingRequest);
  EXPECT_TRUE(DecodeFencingSet(R"(["*", "*"])").IsAll());
}

TEST(FencingSet, JsonConversion) {
  nlohmann::json const json = FencingSet{"pg-1"};
  EXPECT_EQ(json, nlohmann::json::array({"pg-1"}));
  EXPECT_EQ(json.get<FencingSet>(), FencingSet{"pg-1"});
}

TEST(FencingSet, ToString) {
  EXPECT_EQ(pgfence::fencing::ToString(FencingSet{}), "no instances");
  EXPECT_EQ(pgfence::fencing::ToString(FencingSet::FenceAll()), "all instances");
  EXPECT_EQ(pgfence::fencing::ToString(FencingSet{"pg-2", "pg-1"}), "[pg-1, pg-2]");
}

TEST(FencingSet, ValidateInstanceName) {
  EXPECT_NO_THROW(pgfence::fencing::ValidateInstanceName("cluster-example-1"));
  EXPECT_THROW(pgfence::fencing::ValidateInstanceName(""), InvalidFencingRequest);
  EXPECT_THROW(pgfence::fencing::ValidateInstanceName("*"), InvalidFencingRequest);
  EXPECT_THROW(pgfence::fencing::ValidateInstanceName("a*b"), InvalidFencingRequest);
  EXPECT_THROW(pgfence::fencing::ValidateInstanceName("a\tb"), InvalidFencingRequest);
  EXPECT_THROW(pgfence::fencing::ValidateInstanceName("a\"b"), InvalidFencingRequest);
}
