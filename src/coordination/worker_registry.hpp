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

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_set>

namespace stitcher::coordination {

struct RegistryCounts {
  size_t running{0};
  size_t ready{0};
};

/**
 * Tracks which workers (`host:port`) are idle and which hold a job.
 *
 * A worker is in at most one of `ready` and `running`. Every operation runs
 * under one mutex. AcquireReady suspends on a condition variable until a
 * worker becomes ready, it never polls.
 */
class WorkerRegistry {
 public:
  WorkerRegistry() = default;
  WorkerRegistry(const WorkerRegistry &) = delete;
  WorkerRegistry &operator=(const WorkerRegistry &) = delete;
  WorkerRegistry(WorkerRegistry &&) = delete;
  WorkerRegistry &operator=(WorkerRegistry &&) = delete;
  ~WorkerRegistry() = default;

  /// Registers `host` as ready unless it's already tracked.
  /// @return true if the host was newly added.
  bool Add(const std::string &host);

  /**
   * Blocks until some worker is ready, moves it to `running` and returns it.
   * Which ready worker is picked is unspecified.
   *
   * @return std::nullopt only if `token` was stopped before a worker became
   *         ready.
   */
  std::optional<std::string> AcquireReady(std::stop_token token = {});

  /**
   * Moves `host` from `running` to `ready`. An untracked host is added as
   * ready. That happens when a Reconcile dropped the host while its job was
   * finishing: the host is then handed out again until the next Reconcile
   * drops it, and a dispatch to it fails over to another worker.
   */
  void Release(const std::string &host);

  /// @return true if `host` was tracked.
  bool Remove(const std::string &host);

  /**
   * Makes the tracked set equal to `active`: untracked active hosts become
   * ready, tracked hosts missing from `active` are dropped.
   *
   * @return the dropped hosts.
   */
  std::unordered_set<std::string> Reconcile(const std::unordered_set<std::string> &active);

  RegistryCounts Counts() const;

  bool IsReady(const std::string &host) const;
  bool IsRunning(const std::string &host) const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable_any ready_cv_;
  std::unordered_set<std::string> ready_;
  std::unordered_set<std::string> running_;
};

}  // namespace stitcher::coordination
