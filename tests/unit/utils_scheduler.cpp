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
#include <chrono>
#include <thread>

#include "utils/scheduler.hpp"

using namespace std::chrono_literals;
using stitcher::utils::Scheduler;

TEST(Scheduler, FirstRunWaitsOnePeriod) {
  std::atomic<int> runs{0};
  Scheduler scheduler;
  scheduler.Run("test", 500ms, [&runs] { ++runs; });

  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(runs, 0);
  std::this_thread::sleep_for(1100ms);
  EXPECT_GE(runs, 2);
  EXPECT_LE(runs, 3);
  scheduler.Stop();

  const int after_stop = runs;
  std::this_thread::sleep_for(600ms);
  EXPECT_EQ(runs, after_stop);
}

TEST(Scheduler, NeverStarted) {
  Scheduler scheduler;
  EXPECT_FALSE(scheduler.IsRunning());
  EXPECT_NO_THROW(scheduler.Stop());
  EXPECT_FALSE(scheduler.IsRunning());
}

TEST(Scheduler, StopIsIdempotent) {
  Scheduler scheduler;
  scheduler.Run("test", 50ms, [] {});
  EXPECT_TRUE(scheduler.IsRunning());
  scheduler.Stop();
  EXPECT_FALSE(scheduler.IsRunning());
  EXPECT_NO_THROW(scheduler.Stop());
}

TEST(Scheduler, StopFromSeveralThreads) {
  std::atomic<int> runs{0};
  Scheduler scheduler;
  scheduler.Run("test", 10ms, [&runs] { ++runs; });
  std::this_thread::sleep_for(50ms);
  {
    std::jthread first([&scheduler] { scheduler.Stop(); });
    std::jthread second([&scheduler] { scheduler.Stop(); });
  }
  EXPECT_FALSE(scheduler.IsRunning());
}

TEST(Scheduler, StopDoesNotWaitForTheNextTick) {
  Scheduler scheduler;
  scheduler.Run("test", 1h, [] {});
  const auto start = std::chrono::steady_clock::now();
  scheduler.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(Scheduler, MissedTicksAreSkipped) {
  std::atomic<int> runs{0};
  std::atomic_bool slow_run_done{false};
  Scheduler scheduler;
  scheduler.Run("test", 200ms, [&] {
    // The first run spans ten periods.
    if (++runs == 1) {
      std::this_thread::sleep_for(2s);
      slow_run_done = true;
    }
  });

  while (!slow_run_done) std::this_thread::sleep_for(20ms);
  std::this_thread::sleep_for(300ms);
  scheduler.Stop();
  EXPECT_LE(runs, 3);
}

TEST(Scheduler, RunReplacesTheTask) {
  std::atomic<int> first{0};
  std::atomic<int> second{0};
  Scheduler scheduler;
  scheduler.Run("test", 50ms, [&first] { ++first; });
  std::this_thread::sleep_for(200ms);
  ASSERT_GE(first, 1);

  scheduler.Run("test", 50ms, [&second] { ++second; });
  const int first_after_replace = first;
  std::this_thread::sleep_for(200ms);
  scheduler.Stop();
  EXPECT_EQ(first, first_after_replace);
  EXPECT_GE(second, 1);
}
