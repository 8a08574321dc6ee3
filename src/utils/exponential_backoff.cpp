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

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace stitcher::utils {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy &policy)
    : policy_(policy), next_delay_(std::min(policy.initial_delay, policy.max_delay)) {}

std::chrono::milliseconds ExponentialBackoff::NextDelay() {
  const auto delay = next_delay_;
  // Doubling stops at the cap, so it can't overflow.
  next_delay_ = delay >= policy_.max_delay / 2 ? policy_.max_delay : delay * 2;
  return delay;
}

bool ExponentialBackoff::wait(const std::stop_token &token) {
  const auto delay = NextDelay();
  std::mutex mutex;
  std::condition_variable_any cv;
  auto lock = std::unique_lock{mutex};
  // Only a stop request can satisfy the predicate, so this is a cancellable sleep.
  cv.wait_for(lock, token, delay, [] { return false; });
  return !token.stop_requested();
}

}  // namespace stitcher::utils
