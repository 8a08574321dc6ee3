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


#include "utils/exponential_backoff.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;
using stitcher::utils::ExponentialBackoff;
using stitcher::utils::RetryPolicy;

TEST(ExponentialBackoff, DelaysDoubleUpToTheCap) {
  ExponentialBackoff backoff{RetryPolicy{.initial_delay = 1000ms, .max_delay = 5s}};

  ASSERT_EQ(1000ms, backoff.NextDelay());
  ASSERT_EQ(2000ms, backoff.NextDelay());
  ASSERT_EQ(4000ms, backoff.NextDelay());
  ASSERT_EQ(5000ms, backoff.NextDelay());
  for (int i = 0; i < 1000; ++i) {
    ASSERT_EQ(5000ms, backoff.NextDelay());
  }
}

TEST(ExponentialBackoff, DefaultRetryPolicy) {
  ExponentialBackoff backoff{RetryPolicy{}};

  ASSERT_EQ(1s, backoff.NextDelay());
  ASSERT_EQ(2s, backoff.NextDelay());
  ASSERT_EQ(4s, backoff.NextDelay());
  ASSERT_EQ(8s, backoff.NextDelay());
  ASSERT_EQ(10s, backoff.NextDelay());
  ASSERT_EQ(10s, backoff.NextDelay());
}

TEST(ExponentialBackoff, InitialDelayAboveTheCap) {
  ExponentialBackoff backoff{RetryPolicy{.initial_delay = 20s, .max_delay = 10s}};
  ASSERT_EQ(10s, backoff.NextDelay());
  ASSERT_EQ(10s, backoff.NextDelay());
}

TEST(ExponentialBackoff, WaitRunsToCompletion) {
  ExponentialBackoff backoff{RetryPolicy{.initial_delay = 10ms, .max_delay = 20ms}};
  std::stop_source source;
  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(backoff.wait(source.get_token()));
  ASSERT_GE(std::chrono::steady_clock::now() - start, 10ms);
}

TEST(ExponentialBackoff, StopInterruptsWait) {
  ExponentialBackoff backoff{RetryPolicy{.initial_delay = 60s, .max_delay = 60s}};
  std::stop_source source;

  const auto start = std::chrono::steady_clock::now();
  std::jthread stopper([&source] {
    std::this_thread::sleep_for(50ms);
    source.request_stop();
  });
  ASSERT_FALSE(backoff.wait(source.get_token()));
  ASSERT_LT(std::chrono::steady_clock::now() - start, 10s);
}

TEST(ExponentialBackoff, StoppedTokenReturnsImmediately) {
  ExponentialBackoff backoff{RetryPolicy{.initial_delay = 60s, .max_delay = 60s}};
  std::stop_source source;
  source.request_stop();
  ASSERT_FALSE(backoff.wait(source.get_token()));
}
