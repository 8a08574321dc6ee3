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

#include "coordination/dispatcher.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

#include "utils/logging.hpp"
#include "utils/thread.hpp"
#include "utils/uuid.hpp"

namespace stitcher::coordination {

Dispatcher::Dispatcher(catalog::WorkCatalog &catalog, WorkerRegistry &registry, SessionTable &sessions,
                       RescheduleQueue &reschedule, WorkerClient &client, DispatcherConfig config)
    : catalog_(catalog),
      registry_(registry),
      sessions_(sessions),
      reschedule_(reschedule),
      client_(client),
      config_(std::move(config)) {}

Dispatcher::~Dispatcher() { Stop(); }

utils::BasicResult<DispatchFailure, std::string> Dispatcher::TryDispatch(const catalog::JobPayload &job,
                                                                         std::stop_token token) {
  auto worker = registry_.AcquireReady(token);
  if (!worker) return DispatchFailure{.kind = DispatchFailureKind::CANCELLED};

  auto session_id = utils::GenerateUUID();
  const bool inserted = sessions_.Insert(Session{.session_id = session_id,
                                                 .worker = *worker,
                                                 .payload = job,
                                                 .status_url = {},
                                                 .created_at = std::chrono::system_clock::now()});
  ST_ASSERT(inserted, "Session id {} is already taken.", session_id);

  const StitchRequest request{.job_payload = job,
                              .callback_url = config_.callback_url,
                              .bucket_uri_prefix = config_.bucket_uri_prefix,
                              .session_id = session_id,
                              .wgs84_pixel_size = config_.wgs84_pixel_size};
  auto response = client_.StartJob(*worker, request);

  if (response.HasError()) {
    ++failed_attempts_;
    if (!sessions_.Take(session_id)) {
      return DispatchFailure{.kind = DispatchFailureKind::SESSION_SWEPT, .worker = *worker, .session_id = session_id};
    }
    registry_.Remove(*worker);
    spdlog::warn("Dispatch of session {} to {} failed ({}), worker removed from the registry.", session_id, *worker,
                 DispatchErrorToString(response.GetError()));
    return DispatchFailure{.kind = DispatchFailureKind::WORKER_FAILED,
                           .worker = *worker,
                           .session_id = session_id,
                           .error = response.GetError()};
  }

  if (!registry_.IsRunning(*worker) && sessions_.Take(session_id)) {
    ++failed_attempts_;
    spdlog::warn("Worker {} left the registry while taking session {}, dispatching the job again.", *worker,
                 session_id);
    return DispatchFailure{.kind = DispatchFailureKind::WORKER_LOST, .worker = *worker, .session_id = session_id};
  }

  if (!sessions_.SetStatusUrl(session_id, response->status_url)) {
    // Either the worker already reported completion or it was swept as dead.
    spdlog::debug("Session {} was resolved before its acknowledgment was recorded.", session_id);
  }
  ++dispatched_;
  spdlog::info("Session {} started on {} for {}/{} at ({}, {}).", session_id, *worker, job.scenario_id, job.raster_id,
               job.bounds.lng_min, job.bounds.lat_min);
  return session_id;
}

bool Dispatcher::DispatchWithRetry(const catalog::JobPayload &job, std::stop_token token) {
  utils::ExponentialBackoff backoff(config_.retry_policy);
  while (!token.stop_requested()) {
    auto result = TryDispatch(job, token);
    if (!result.HasError()) return true;

    const auto &failure = result.GetError();
    switch (failure.kind) {
      case DispatchFailureKind::CANCELLED:
        return false;
      case DispatchFailureKind::SESSION_SWEPT:
        spdlog::info("Worker {} vanished during dispatch of session {}, the job was already rescheduled.",
                     failure.worker, failure.session_id);
        return true;
      case DispatchFailureKind::WORKER_LOST:
        continue;
      case DispatchFailureKind::WORKER_FAILED:
        break;
    }
    if (!backoff.wait(token)) return false;
  }
  return false;
}

size_t Dispatcher::DrainBacklog(std::stop_token token) {
  const auto backlog = catalog_.ReadBacklog();
  spdlog::info("Dispatching a backlog of {} work items.", backlog.size());

  size_t handed_out = 0;
  for (const auto &item : backlog) {
    if (!DispatchWithRetry(item.payload, token)) break;
    ++handed_out;
  }
  spdlog::info("Backlog pass done, {} of {} work items handed out.", handed_out, backlog.size());
  return handed_out;
}

void Dispatcher::Run(std::stop_token token) {
  DrainBacklog(token);
  while (!token.stop_requested()) {
    auto job = reschedule_.pop(token);
    if (!job) break;
    spdlog::info("Redelivering rescheduled job {}/{} at ({}, {}).", job->scenario_id, job->raster_id,
                 job->bounds.lng_min, job->bounds.lat_min);
    if (!DispatchWithRetry(*job, token)) {
      // Cancelled mid redelivery. Keep the job for whoever drains the queue next.
      if (!reschedule_.push(*job)) {
        spdlog::warn("Rescheduled job {}/{} dropped on shutdown.", job->scenario_id, job->raster_id);
      }
      break;
    }
  }
  spdlog::info("Dispatcher stopped.");
}

void Dispatcher::Start() {
  thread_ = std::jthread([this](std::stop_token token) {
    utils::ThreadSetName("Dispatcher");
    Run(token);
  });
}

void Dispatcher::RequestStop() { thread_.request_stop(); }

void Dispatcher::Stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

DispatcherStats Dispatcher::Stats() const {
  return {.dispatched = dispatched_.load(), .failed_attempts = failed_attempts_.load()};
}

}  // namespace stitcher::coordination
