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

#include <atomic>
#include <thread>

#include "coordination/session_table.hpp"

using stitcher::catalog::JobPayload;
using stitcher::coordination::Session;
using stitcher::coordination::SessionTable;

namespace {
Session MakeSession(std::string id, std::string worker, double lng_min = 0.0) {
  return {.session_id = std::move(id),
          .worker = std::move(worker),
          .payload = {.scenario_id = "A",
                      .raster_id = "r",
                      .bounds = {.lng_min = lng_min, .lat_min = 0.0, .lng_max = lng_min + 2.0, .lat_max = 2.0}},
          .status_url = {},
          .created_at = std::chrono::system_clock::now()};
}
}  // namespace

TEST(SessionTable, InsertAndTake) {
  SessionTable table;
  EXPECT_TRUE(table.Insert(MakeSession("s1", "w1:8888")));
  EXPECT_FALSE(table.Insert(MakeSession("s1", "w2:8888")));
  EXPECT_EQ(table.Size(), 1);
  EXPECT_TRUE(table.Contains("s1"));

  const auto session = table.Take("s1");
  ASSERT_TRUE(session.has_value());
  EXPECT_EQ(session->worker, "w1:8888");
  EXPECT_FALSE(table.Contains("s1"));
  EXPECT_FALSE(table.Take("s1").has_value());
  EXPECT_EQ(table.Size(), 0);
}

TEST(SessionTable, StatusUrl) {
  SessionTable table;
  ASSERT_TRUE(table.Insert(MakeSession("s1", "w1:8888")));
  EXPECT_TRUE(table.Find("s1")->status_url.empty());

  EXPECT_TRUE(table.SetStatusUrl("s1", "http://w1:8888/api/v1/status/s1"));
  EXPECT_EQ(table.Find("s1")->status_url, "http://w1:8888/api/v1/status/s1");

  ASSERT_TRUE(table.Take("s1").has_value());
  EXPECT_FALSE(table.SetStatusUrl("s1", "late"));
  EXPECT_FALSE(table.Find("s1").has_value());
}

TEST(SessionTable, TakeAllForWorker) {
  SessionTable table;
  ASSERT_TRUE(table.Insert(MakeSession("s1", "w1:8888", 0.0)));
  ASSERT_TRUE(table.Insert(MakeSession("s2", "w2:8888", 2.0)));
  ASSERT_TRUE(table.Insert(MakeSession("s3", "w1:8888", 4.0)));

  auto taken = table.TakeAllForWorker("w1:8888");
  ASSERT_EQ(taken.size(), 2);
  for (const auto &session : taken) EXPECT_EQ(session.worker, "w1:8888");
  EXPECT_EQ(table.Size(), 1);
  EXPECT_TRUE(table.Contains("s2"));
  EXPECT_TRUE(table.TakeAllForWorker("w1:8888").empty());
}

TEST(SessionTable, ConcurrentResolutionHappensOnce) {
  constexpr int kRounds = 200;
  for (int round = 0; round < kRounds; ++round) {
    SessionTable table;
    ASSERT_TRUE(table.Insert(MakeSession("s", "w1:8888")));

    std::atomic<int> resolved{0};
    std::atomic<bool> go{false};
    {
      std::jthread completion([&] {
        while (!go) std::this_thread::yield();
        if (table.Take("s")) ++resolved;
      });
      std::jthread sweep([&] {
        while (!go) std::this_thread::yield();
        resolved += static_cast<int>(table.TakeAllForWorker("w1:8888").size());
      });
      go = true;
    }
    ASSERT_EQ(resolved, 1) << "round " << round;
    ASSERT_EQ(table.Size(), 0);
  }
}
