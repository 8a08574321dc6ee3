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


#pragma once

#include <chrono>
#include <stop_token>

namespace stitcher::utils {

/**
 * Delay schedule for retried operations. The delay starts at `initial_delay`,
 * doubles after every failed attempt and saturates at `max_delay`.
 *
 * There is no attempt cap: an operation retried under this policy is retried
 * until it succeeds or its caller is cancelled.
 */
struct RetryPolicy {
  std::chrono::milliseconds initial_delay{std::chrono::seconds{1}};
  std::chrono::milliseconds max_delay{std::chrono::seconds{10}};
};

/// Backoff state of one retried operation. Not thread safe.
class ExponentialBackoff {
 public:
  explicit ExponentialBackoff(const RetryPolicy &policy);

  /// Delay to apply before the next attempt. Advances the schedule.
  std::chrono::milliseconds NextDelay();

  /// Sleeps for NextDelay() unless `token` is stopped first.
  /// @return false if the wait was cut short by a stop request.
  bool wait(const std::stop_token &token);

 private:
  RetryPolicy policy_;
  std::chrono::milliseconds next_delay_;
};

}  // namespace stitcher::utils
