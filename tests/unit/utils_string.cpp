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

#include "utils/string.hpp"

using namespace stitcher::utils;

TEST(StringUtils, Trim) {
  EXPECT_EQ(Trim(""), "");
  EXPECT_EQ(Trim("   "), "");
  EXPECT_EQ(Trim("  worker-1:8888 \t"), "worker-1:8888");
  EXPECT_EQ(Trim("a b"), "a b");
}

TEST(StringUtils, SplitList) {
  EXPECT_TRUE(SplitList("").empty());
  EXPECT_TRUE(SplitList(" , ,").empty());

  const std::vector<std::string> expected{"10.0.0.1:8888", "10.0.0.2:8888"};
  EXPECT_EQ(SplitList("10.0.0.1:8888,10.0.0.2:8888"), expected);
  EXPECT_EQ(SplitList(" 10.0.0.1:8888 ,, 10.0.0.2:8888 "), expected);
  EXPECT_EQ(SplitList("a;b", ";"), (std::vector<std::string>{"a", "b"}));
}

TEST(StringUtils, Split) {
  EXPECT_TRUE(Split("", "/").empty());
  EXPECT_EQ(Split("a/b/c", "/"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(Split("a/b/c", "/", 1), (std::vector<std::string>{"a", "b/c"}));
  EXPECT_EQ(Split("a//c", "/"), (std::vector<std::string>{"a", "", "c"}));
}

TEST(StringUtils, Join) {
  EXPECT_EQ(Join({}, ", "), "");
  EXPECT_EQ(Join({"only"}, ", "), "only");
  EXPECT_EQ(Join({"n_export", "modified_load"}, ", "), "n_export, modified_load");
}
