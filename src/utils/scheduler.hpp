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
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace stitcher::utils {

/**
 * Runs a task on its own named thread once per period.
 *
 * The first run happens one period after Run. Ticks are aligned to multiples
 * of the period counted from Run; ticks missed while the task was busy are
 * skipped, not replayed.
 */
class Scheduler {
 public:
  Scheduler() = default;
  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;
  Scheduler(Scheduler &&) = delete;
  Scheduler &operator=(Scheduler &&) = delete;
  ~Scheduler() { Stop(); }

  /// Replaces a running task, if any. `period` must be positive.
  void Run(const std::string &thread_name, std::chrono::milliseconds period, std::function<void()> task);

  /// Stops the thread after a task run in progress. Safe to call from several threads.
  void Stop();

  bool IsRunning() const;

 private:
  void Loop(std::chrono::milliseconds period, const std::function<void()> &task, std::stop_token token);

  std::mutex mutex_;
  std::condition_variable_any wakeup_;
  std::jthread thread_;
};

}  // namespace stitcher::utils
