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

#include <chrono>
#include <future>
#include <stop_token>
#include <string>

#include "utils/data_queue.hpp"

using namespace std::chrono_literals;
using stitcher::utils::DataQueue;

TEST(DataQueue, TryPushFailsWhenFull) {
  DataQueue<std::string> queue(2);
  EXPECT_TRUE(queue.try_push("a"));
  EXPECT_TRUE(queue.try_push("b"));
  for (int i = 0; i < 100; ++i) EXPECT_FALSE(queue.try_push("c"));
  EXPECT_EQ(queue.size(), 2);

  EXPECT_EQ(queue.try_pop(), "a");
  EXPECT_TRUE(queue.try_push("d"));
  EXPECT_EQ(queue.pop(), "b");
  EXPECT_EQ(queue.pop(), "d");
}

TEST(DataQueue, UnboundedByDefault) {
  DataQueue<int> queue;
  for (int i = 0; i < 1000; ++i) ASSERT_TRUE(queue.try_push(i));
  EXPECT_EQ(queue.size(), 1000);
}

TEST(DataQueue, PushBlocksUntilPop) {
  DataQueue<int> queue(1);
  ASSERT_TRUE(queue.push(1));
  auto pushed = std::async(std::launch::async, [&queue] { return queue.push(2); });
  EXPECT_EQ(pushed.wait_for(200ms), std::future_status::timeout);

  EXPECT_EQ(queue.pop(), 1);
  ASSERT_EQ(pushed.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(pushed.get());
  EXPECT_EQ(queue.pop(), 2);
}

TEST(DataQueue, FinishUnblocksPush) {
  DataQueue<int> queue(1);
  ASSERT_TRUE(queue.push(1));
  auto pushed = std::async(std::launch::async, [&queue] { return queue.push(2); });
  EXPECT_EQ(pushed.wait_for(200ms), std::future_status::timeout);

  queue.finish();
  ASSERT_EQ(pushed.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(pushed.get());
  EXPECT_FALSE(queue.try_push(3));
  // Items pushed before finish() are still handed out.
  EXPECT_EQ(queue.pop(), 1);
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(DataQueue, StopUnblocksPop) {
  DataQueue<int> queue;
  std::stop_source source;
  auto popped = std::async(std::launch::async, [&queue, token = source.get_token()] { return queue.pop(token); });
  EXPECT_EQ(popped.wait_for(200ms), std::future_status::timeout);

  source.request_stop();
  ASSERT_EQ(popped.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(popped.get().has_value());
}
