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
#include <cstdint>
#include <string>
#include <unordered_set>

#include "coordination/host_source.hpp"
#include "coordination/queues.hpp"
#include "coordination/session_table.hpp"
#include "coordination/worker_registry.hpp"
#include "utils/result.hpp"
#include "utils/scheduler.hpp"

namespace stitcher::coordination {

enum class DiscoveryCycleError : uint8_t {
  SOURCE_FAILED,
  UNEXPECTED_FAILURE,
};

struct DiscoveryCycleReport {
  size_t active{0};
  std::unordered_set<std::string> dead;
  size_t rescheduled{0};
};

/**
 * Keeps the WorkerRegistry in line with the HostSource. This is the only
 * failure detector: a worker that dies is noticed at the next cycle.
 *
 * A cycle lists the live hosts, reconciles the registry with them and sweeps
 * every open session of a dropped host into the RescheduleQueue.
 */
class FleetDiscovery {
 public:
  FleetDiscovery(HostSource &source, WorkerRegistry &registry, SessionTable &sessions, RescheduleQueue &reschedule,
                 std::chrono::seconds interval);

  FleetDiscovery(const FleetDiscovery &) = delete;
  FleetDiscovery &operator=(const FleetDiscovery &) = delete;
  FleetDiscovery(FleetDiscovery &&) = delete;
  FleetDiscovery &operator=(FleetDiscovery &&) = delete;
  ~FleetDiscovery();

  /// Runs one cycle on the calling thread. Never throws.
  utils::BasicResult<DiscoveryCycleError, DiscoveryCycleReport> RunOnce();

  /// Runs the first cycle right away. A dynamic source is then polled every
  /// `interval` on the scheduler thread, a static one is left alone.
  void Start();

  void Stop();

  bool IsRunning() { return scheduler_.IsRunning(); }

 private:
  size_t SweepDeadHost(const std::string &host);

  HostSource &source_;
  WorkerRegistry &registry_;
  SessionTable &sessions_;
  RescheduleQueue &reschedule_;
  std::chrono::seconds interval_;
  utils::Scheduler scheduler_;
};

}  // namespace stitcher::coordination
