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

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "catalog/work_item.hpp"
#include "utils/result.hpp"

namespace stitcher::coordination {

enum class DispatchError : uint8_t {
  // Transport failure or timeout.
  WORKER_UNREACHABLE,
  // The worker answered with a non 2xx status.
  WORKER_REJECTED,
  // 2xx, but the body isn't JSON with a string `status_url`.
  MALFORMED_RESPONSE,
};

std::string_view DispatchErrorToString(DispatchError error);

/// Body of `POST /api/v1/stitch_grid_cell`.
struct StitchRequest {
  catalog::JobPayload job_payload;
  std::string callback_url;
  std::string bucket_uri_prefix;
  std::string session_id;
  double wgs84_pixel_size;
};

void to_json(nlohmann::json &data, const StitchRequest &request);

struct StitchResponse {
  std::string status_url;
};

/// Outbound RPC to a worker.
class WorkerClient {
 public:
  WorkerClient() = default;
  WorkerClient(const WorkerClient &) = delete;
  WorkerClient &operator=(const WorkerClient &) = delete;
  WorkerClient(WorkerClient &&) = delete;
  WorkerClient &operator=(WorkerClient &&) = delete;
  virtual ~WorkerClient() = default;

  /// Asks `worker` (`host:port`) to start the job. Blocks until the worker
  /// acknowledges, refuses or the request times out.
  virtual utils::BasicResult<DispatchError, StitchResponse> StartJob(const std::string &worker,
                                                                     const StitchRequest &request) = 0;
};

class HttpWorkerClient final : public WorkerClient {
 public:
  explicit HttpWorkerClient(int timeout_in_seconds) : timeout_in_seconds_(timeout_in_seconds) {}

  utils::BasicResult<DispatchError, StitchResponse> StartJob(const std::string &worker,
                                                             const StitchRequest &request) override;

 private:
  int timeout_in_seconds_;
};

}  // namespace stitcher::coordination
