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

#include "coordination/worker_registry.hpp"

#include <spdlog/spdlog.h>

namespace stitcher::coordination {

bool WorkerRegistry::Add(const std::string &host) {
  {
    auto guard = std::unique_lock{mutex_};
    if (ready_.contains(host) || running_.contains(host)) return false;
    ready_.insert(host);
  }
  ready_cv_.notify_all();
  spdlog::info("Worker {} registered as ready.", host);
  return true;
}

std::optional<std::string> WorkerRegistry::AcquireReady(std::stop_token token) {
  auto guard = std::unique_lock{mutex_};
  if (!ready_cv_.wait(guard, token, [this] { return !ready_.empty(); })) {
    return std::nullopt;
  }
  auto node = ready_.extract(ready_.begin());
  auto host = node.value();
  running_.insert(std::move(node));
  return host;
}

void WorkerRegistry::Release(const std::string &host) {
  {
    auto guard = std::unique_lock{mutex_};
    running_.erase(host);
    ready_.insert(host);
  }
  ready_cv_.notify_all();
}

bool WorkerRegistry::Remove(const std::string &host) {
  auto guard = std::unique_lock{mutex_};
  return ready_.erase(host) + running_.erase(host) > 0;
}

std::unordered_set<std::string> WorkerRegistry::Reconcile(const std::unordered_set<std::string> &active) {
  std::unordered_set<std::string> dead;
  bool has_ready = false;
  {
    auto guard = std::unique_lock{mutex_};
    for (auto *tracked : {&ready_, &running_}) {
      for (auto it = tracked->begin(); it != tracked->end();) {
        if (active.contains(*it)) {
          ++it;
          continue;
        }
        dead.insert(*it);
        it = tracked->erase(it);
      }
    }
    for (const auto &host : active) {
      if (!running_.contains(host)) ready_.insert(host);
    }
    has_ready = !ready_.empty();
  }
  if (has_ready) ready_cv_.notify_all();
  return dead;
}

RegistryCounts WorkerRegistry::Counts() const {
  auto guard = std::unique_lock{mutex_};
  return {.running = running_.size(), .ready = ready_.size()};
}

bool WorkerRegistry::IsReady(const std::string &host) const {
  auto guard = std::unique_lock{mutex_};
  return ready_.contains(host);
}

bool WorkerRegistry::IsRunning(const std::string &host) const {
  auto guard = std::unique_lock{mutex_};
  return running_.contains(host);
}

}  // namespace stitcher::coordination
