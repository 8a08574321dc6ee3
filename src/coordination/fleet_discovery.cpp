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

#include "coordination/fleet_discovery.hpp"

#include <spdlog/spdlog.h>

namespace stitcher::coordination {

FleetDiscovery::FleetDiscovery(HostSource &source, WorkerRegistry &registry, SessionTable &sessions,
                               RescheduleQueue &reschedule, std::chrono::seconds interval)
    : source_(source), registry_(registry), sessions_(sessions), reschedule_(reschedule), interval_(interval) {}

FleetDiscovery::~FleetDiscovery() { Stop(); }

utils::BasicResult<DiscoveryCycleError, DiscoveryCycleReport> FleetDiscovery::RunOnce() {
  std::unordered_set<std::string> active;
  try {
    active = source_.ListWorkerHosts();
  } catch (const DiscoveryError &e) {
    spdlog::warn("Fleet discovery cycle failed, keeping the current registry. {}", e.what());
    return DiscoveryCycleError::SOURCE_FAILED;
  } catch (const std::exception &e) {
    spdlog::error("Unexpected failure while listing workers, keeping the current registry. {}", e.what());
    return DiscoveryCycleError::UNEXPECTED_FAILURE;
  }

  DiscoveryCycleReport report{.active = active.size(), .dead = registry_.Reconcile(active), .rescheduled = 0};
  for (const auto &host : report.dead) {
    report.rescheduled += SweepDeadHost(host);
  }

  const auto counts = registry_.Counts();
  spdlog::debug("Fleet discovery: {} active, {} dead, {} rescheduled. Registry: {} running, {} ready.", report.active,
                report.dead.size(), report.rescheduled, counts.running, counts.ready);
  return report;
}

size_t FleetDiscovery::SweepDeadHost(const std::string &host) {
  auto lost = sessions_.TakeAllForWorker(host);
  if (lost.empty()) {
    spdlog::info("Worker {} is gone.", host);
    return 0;
  }
  for (auto &session : lost) {
    spdlog::warn("Worker {} is gone while running session {}, rescheduling its job.", host, session.session_id);
    if (!reschedule_.push(std::move(session.payload))) {
      spdlog::error("Reschedule queue is closed, job of session {} is dropped.", session.session_id);
    }
  }
  return lost.size();
}

void FleetDiscovery::Start() {
  (void)RunOnce();
  if (source_.IsStatic()) {
    spdlog::info("Static worker list reconciled, fleet discovery won't poll.");
    return;
  }
  scheduler_.Run("FleetDiscovery", interval_, [this] { (void)RunOnce(); });
  spdlog::info("Fleet discovery polling every {}s.", interval_.count());
}

void FleetDiscovery::Stop() { scheduler_.Stop(); }

}  // namespace stitcher::coordination
