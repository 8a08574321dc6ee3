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

#include "utils/scheduler.hpp"

#include "utils/logging.hpp"
#include "utils/thread.hpp"

namespace stitcher::utils {

void Scheduler::Run(const std::string &thread_name, std::chrono::milliseconds period, std::function<void()> task) {
  ST_ASSERT(period > std::chrono::milliseconds::zero(), "Scheduler period must be positive, got {}ms.",
            period.count());
  Stop();
  thread_ = std::jthread([this, thread_name, period, task = std::move(task)](std::stop_token token) {
    ThreadSetName(thread_name);
    Loop(period, task, token);
  });
}

void Scheduler::Loop(std::chrono::milliseconds period, const std::function<void()> &task, std::stop_token token) {
  auto next_tick = std::chrono::steady_clock::now() + period;
  while (true) {
    {
      auto guard = std::unique_lock{mutex_};
      wakeup_.wait_until(guard, token, next_tick, [] { return false; });
      if (token.stop_requested()) return;
    }

    task();

    const auto now = std::chrono::steady_clock::now();
    next_tick += period;
    if (next_tick <= now) {
      // Skip to the first tick after now.
      next_tick += ((now - next_tick) / period + 1) * period;
    }
  }
}

// Only the caller whose stop request succeeds joins the thread.
void Scheduler::Stop() {
  if (!thread_.request_stop()) return;
  wakeup_.notify_all();
  if (thread_.joinable()) thread_.join();
}

// stop_possible() is false for a scheduler that was never started.
bool Scheduler::IsRunning() const {
  const auto token = thread_.get_stop_token();
  return token.stop_possible() && !token.stop_requested();
}

}  // namespace stitcher::utils
