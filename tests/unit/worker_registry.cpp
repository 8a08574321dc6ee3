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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iterator>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <unordered_set>
#include <vector>

#include "coordination/worker_registry.hpp"

using namespace std::chrono_literals;
using stitcher::coordination::WorkerRegistry;

namespace {
void ExpectDisjoint(const WorkerRegistry &registry, const std::vector<std::string> &hosts) {
  for (const auto &host : hosts) {
    EXPECT_FALSE(registry.IsReady(host) && registry.IsRunning(host)) << host;
  }
}
}  // namespace

TEST(WorkerRegistry, AddIsIdempotent) {
  WorkerRegistry registry;
  EXPECT_TRUE(registry.Add("w1:8888"));
  EXPECT_FALSE(registry.Add("w1:8888"));
  EXPECT_EQ(registry.Counts().ready, 1);
  EXPECT_EQ(registry.Counts().running, 0);
}

TEST(WorkerRegistry, AcquireAndRelease) {
  WorkerRegistry registry;
  registry.Add("w1:8888");

  const auto host = registry.AcquireReady();
  ASSERT_TRUE(host.has_value());
  EXPECT_EQ(*host, "w1:8888");
  EXPECT_TRUE(registry.IsRunning("w1:8888"));
  EXPECT_FALSE(registry.IsReady("w1:8888"));

  // A running worker isn't added again.
  EXPECT_FALSE(registry.Add("w1:8888"));
  EXPECT_TRUE(registry.IsRunning("w1:8888"));

  registry.Release("w1:8888");
  EXPECT_TRUE(registry.IsReady("w1:8888"));
  EXPECT_FALSE(registry.IsRunning("w1:8888"));
  ExpectDisjoint(registry, {"w1:8888"});
}

TEST(WorkerRegistry, ReleaseUnknownHostMakesItReady) {
  WorkerRegistry registry;
  registry.Release("w9:8888");
  EXPECT_TRUE(registry.IsReady("w9:8888"));
}

TEST(WorkerRegistry, ReleaseAfterReconcileDroppedTheHost) {
  WorkerRegistry registry;
  registry.Add("w1:8888");
  ASSERT_EQ(registry.AcquireReady(), "w1:8888");
  EXPECT_THAT(registry.Reconcile({}), testing::UnorderedElementsAre("w1:8888"));

  // The job finished after the host was dropped.
  registry.Release("w1:8888");
  EXPECT_TRUE(registry.IsReady("w1:8888"));
  EXPECT_THAT(registry.Reconcile({}), testing::UnorderedElementsAre("w1:8888"));
  EXPECT_EQ(registry.Counts().ready, 0);
}

TEST(WorkerRegistry, Remove) {
  WorkerRegistry registry;
  registry.Add("w1:8888");
  registry.Add("w2:8888");
  ASSERT_TRUE(registry.AcquireReady().has_value());

  EXPECT_TRUE(registry.Remove("w1:8888"));
  EXPECT_TRUE(registry.Remove("w2:8888"));
  EXPECT_FALSE(registry.Remove("w2:8888"));
  EXPECT_EQ(registry.Counts().ready, 0);
  EXPECT_EQ(registry.Counts().running, 0);
}

TEST(WorkerRegistry, AcquireBlocksUntilAdd) {
  WorkerRegistry registry;
  auto acquired = std::async(std::launch::async, [&registry] { return registry.AcquireReady(); });

  EXPECT_EQ(acquired.wait_for(200ms), std::future_status::timeout);
  registry.Add("w1:8888");

  ASSERT_EQ(acquired.wait_for(5s), std::future_status::ready);
  const auto host = acquired.get();
  ASSERT_TRUE(host.has_value());
  EXPECT_EQ(*host, "w1:8888");
  EXPECT_TRUE(registry.IsRunning("w1:8888"));
}

TEST(WorkerRegistry, AcquireWakesOnRelease) {
  WorkerRegistry registry;
  registry.Add("w1:8888");
  ASSERT_TRUE(registry.AcquireReady().has_value());

  auto acquired = std::async(std::launch::async, [&registry] { return registry.AcquireReady(); });
  EXPECT_EQ(acquired.wait_for(200ms), std::future_status::timeout);

  registry.Release("w1:8888");
  ASSERT_EQ(acquired.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(acquired.get(), "w1:8888");
}

TEST(WorkerRegistry, StopUnblocksAcquire) {
  WorkerRegistry registry;
  std::stop_source source;
  auto acquired = std::async(std::launch::async,
                             [&registry, token = source.get_token()] { return registry.AcquireReady(token); });

  EXPECT_EQ(acquired.wait_for(200ms), std::future_status::timeout);
  source.request_stop();
  ASSERT_EQ(acquired.wait_for(5s), std::future_status::ready);
  EXPECT_FALSE(acquired.get().has_value());
}

TEST(WorkerRegistry, ReconcileReturnsDeadHosts) {
  WorkerRegistry registry;
  registry.Add("w1:8888");
  registry.Add("w2:8888");
  registry.Add("w3:8888");
  // Make one of them running.
  const auto running = registry.AcquireReady();
  ASSERT_TRUE(running.has_value());

  const auto dead = registry.Reconcile({"w4:8888"});
  EXPECT_THAT(dead, testing::UnorderedElementsAre("w1:8888", "w2:8888", "w3:8888"));
  EXPECT_TRUE(registry.IsReady("w4:8888"));
  EXPECT_FALSE(registry.IsRunning(*running));
  EXPECT_EQ(registry.Counts().ready, 1);
  EXPECT_EQ(registry.Counts().running, 0);
}

TEST(WorkerRegistry, ReconcileKeepsRunningHosts) {
  WorkerRegistry registry;
  registry.Add("w1:8888");
  ASSERT_TRUE(registry.AcquireReady().has_value());

  const auto dead = registry.Reconcile({"w1:8888", "w2:8888"});
  EXPECT_TRUE(dead.empty());
  EXPECT_TRUE(registry.IsRunning("w1:8888"));
  EXPECT_TRUE(registry.IsReady("w2:8888"));
  ExpectDisjoint(registry, {"w1:8888", "w2:8888"});
}

TEST(WorkerRegistry, ReconcileWakesAcquire) {
  WorkerRegistry registry;
  auto acquired = std::async(std::launch::async, [&registry] { return registry.AcquireReady(); });
  EXPECT_EQ(acquired.wait_for(100ms), std::future_status::timeout);

  EXPECT_TRUE(registry.Reconcile({"w1:8888"}).empty());
  ASSERT_EQ(acquired.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(acquired.get(), "w1:8888");
}

TEST(WorkerRegistry, ConcurrentAcquireHandsOutEachWorkerOnce) {
  constexpr int kWorkers = 8;
  WorkerRegistry registry;
  std::vector<std::string> hosts;
  for (int i = 0; i < kWorkers; ++i) {
    hosts.push_back("w" + std::to_string(i) + ":8888");
    registry.Add(hosts.back());
  }

  std::mutex mutex;
  std::unordered_set<std::string> acquired;
  {
    std::vector<std::jthread> threads;
    for (int i = 0; i < kWorkers; ++i) {
      threads.emplace_back([&] {
        auto host = registry.AcquireReady();
        ASSERT_TRUE(host.has_value());
        auto guard = std::lock_guard{mutex};
        EXPECT_TRUE(acquired.insert(*host).second);
      });
    }
  }
  EXPECT_THAT(acquired, testing::UnorderedElementsAreArray(hosts));
  EXPECT_EQ(registry.Counts().running, kWorkers);
  EXPECT_EQ(registry.Counts().ready, 0);
  ExpectDisjoint(registry, hosts);
}

// Random operation sequences against a plain two-set model of the registry.
TEST(WorkerRegistry, RandomSequencesMatchModel) {
  const std::vector<std::string> hosts{"w1:8888", "w2:8888", "w3:8888", "w4:8888"};
  std::mt19937 gen{20231019};
  std::uniform_int_distribution<size_t> pick_host(0, hosts.size() - 1);
  std::uniform_int_distribution<int> pick_op(0, 4);
  std::bernoulli_distribution coin;

  for (int round = 0; round < 50; ++round) {
    WorkerRegistry registry;
    std::set<std::string> ready;
    std::set<std::string> running;

    for (int step = 0; step < 200; ++step) {
      const auto &host = hosts[pick_host(gen)];
      switch (pick_op(gen)) {
        case 0: {
          const bool tracked = ready.contains(host) || running.contains(host);
          EXPECT_EQ(registry.Add(host), !tracked) << host;
          if (!tracked) ready.insert(host);
          break;
        }
        case 1: {
          // AcquireReady blocks on an empty ready set.
          if (ready.empty()) break;
          const auto acquired = registry.AcquireReady();
          ASSERT_TRUE(acquired.has_value());
          ASSERT_TRUE(ready.contains(*acquired)) << *acquired;
          ready.erase(*acquired);
          running.insert(*acquired);
          break;
        }
        case 2:
          registry.Release(host);
          running.erase(host);
          ready.insert(host);
          break;
        case 3: {
          const bool tracked = ready.contains(host) || running.contains(host);
          EXPECT_EQ(registry.Remove(host), tracked) << host;
          ready.erase(host);
          running.erase(host);
          break;
        }
        case 4: {
          std::unordered_set<std::string> active;
          for (const auto &candidate : hosts) {
            if (coin(gen)) active.insert(candidate);
          }
          std::unordered_set<std::string> expected_dead;
          for (const auto *tracked : {&ready, &running}) {
            std::copy_if(tracked->begin(), tracked->end(), std::inserter(expected_dead, expected_dead.end()),
                         [&](const std::string &h) { return !active.contains(h); });
          }
          EXPECT_EQ(registry.Reconcile(active), expected_dead);
          std::erase_if(ready, [&](const std::string &h) { return !active.contains(h); });
          std::erase_if(running, [&](const std::string &h) { return !active.contains(h); });
          for (const auto &h : active) {
            if (!running.contains(h)) ready.insert(h);
          }
          break;
        }
      }

      for (const auto &h : hosts) {
        ASSERT_EQ(registry.IsReady(h), ready.contains(h)) << "round " << round << " step " << step << " " << h;
        ASSERT_EQ(registry.IsRunning(h), running.contains(h)) << "round " << round << " step " << step << " " << h;
      }
      ExpectDisjoint(registry, hosts);
      ASSERT_EQ(registry.Counts().ready, ready.size());
      ASSERT_EQ(registry.Counts().running, running.size());
    }
  }
}
