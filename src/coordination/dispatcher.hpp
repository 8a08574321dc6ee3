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

#include <atomic>
#include <cstdint>
#include <stop_token>
#include <string>
#include <thread>

#include "catalog/work_catalog.hpp"
#include "coordination/queues.hpp"
#include "coordination/session_table.hpp"
#include "coordination/worker_client.hpp"
#include "coordination/worker_registry.hpp"
#include "utils/exponential_backoff.hpp"
#include "utils/result.hpp"

namespace stitcher::coordination {

struct DispatcherConfig {
  std::string callback_url;
  std::string bucket_uri_prefix;
  double wgs84_pixel_size;
  utils::RetryPolicy retry_policy{};
};

enum class DispatchFailureKind : uint8_t {
  // The stop token fired while waiting for a worker.
  CANCELLED,
  // The worker couldn't take the job, see DispatchError.
  WORKER_FAILED,
  // Fleet discovery declared the worker dead mid-dispatch and already
  // rescheduled the job.
  SESSION_SWEPT,
  // Fleet discovery dropped the worker before its session was visible to the
  // dead host sweep. The session was taken back, the job is still ours.
  WORKER_LOST,
};

struct DispatchFailure {
  DispatchFailureKind kind;
  std::string worker;
  std::string session_id;
  DispatchError error{DispatchError::WORKER_UNREACHABLE};
};

struct DispatcherStats {
  uint64_t dispatched{0};
  uint64_t failed_attempts{0};
};

/**
 * Hands jobs to ready workers.
 *
 * Waiting for a ready worker is the only backpressure: with N workers at most
 * N jobs are in flight. The Session is recorded before the worker is called,
 * so a completion callback can never arrive for a session the coordinator
 * doesn't know yet.
 */
class Dispatcher {
 public:
  Dispatcher(catalog::WorkCatalog &catalog, WorkerRegistry &registry, SessionTable &sessions,
             RescheduleQueue &reschedule, WorkerClient &client, DispatcherConfig config);

  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;
  Dispatcher(Dispatcher &&) = delete;
  Dispatcher &operator=(Dispatcher &&) = delete;
  ~Dispatcher();

  /**
   * One dispatch attempt: acquire a worker, open a session and ask the worker
   * to start `job`. On a worker failure the session is dropped and the worker
   * is removed from the registry. An accepted job whose worker is no longer
   * running in the registry is taken back as WORKER_LOST, since no later
   * discovery cycle would sweep its session.
   *
   * @return id of the opened session.
   */
  utils::BasicResult<DispatchFailure, std::string> TryDispatch(const catalog::JobPayload &job,
                                                               std::stop_token token = {});

  /**
   * Retries TryDispatch with exponential backoff until the job is accepted.
   * The retry policy has no attempt cap. A WORKER_LOST attempt is retried
   * right away.
   *
   * @return false only if `token` was stopped first.
   */
  bool DispatchWithRetry(const catalog::JobPayload &job, std::stop_token token = {});

  /// One pass over the catalog backlog.
  /// @return number of jobs handed out.
  size_t DrainBacklog(std::stop_token token = {});

  /// DrainBacklog, then redeliver rescheduled jobs until `token` is stopped.
  void Run(std::stop_token token);

  /// Runs Run on a dedicated thread.
  void Start();
  /// Cancels the dispatcher thread without waiting for it.
  void RequestStop();
  void Stop();

  DispatcherStats Stats() const;

 private:
  catalog::WorkCatalog &catalog_;
  WorkerRegistry &registry_;
  SessionTable &sessions_;
  RescheduleQueue &reschedule_;
  WorkerClient &client_;
  DispatcherConfig config_;

  std::atomic<uint64_t> dispatched_{0};
  std::atomic<uint64_t> failed_attempts_{0};

  std::jthread thread_;
};

}  // namespace stitcher::coordination
