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

#include "coordination/worker_client.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "requests/requests.hpp"

namespace stitcher::coordination {

std::string_view DispatchErrorToString(DispatchError error) {
  switch (error) {
    case DispatchError::WORKER_UNREACHABLE:
      return "worker unreachable";
    case DispatchError::WORKER_REJECTED:
      return "worker rejected the job";
    case DispatchError::MALFORMED_RESPONSE:
      return "malformed worker response";
  }
  return "unknown dispatch error";
}

void to_json(nlohmann::json &data, const StitchRequest &request) {
  data = nlohmann::json{{"job_payload", request.job_payload},
                        {"callback_url", request.callback_url},
                        {"bucket_uri_prefix", request.bucket_uri_prefix},
                        {"session_id", request.session_id},
                        {"wgs84_pixel_size", request.wgs84_pixel_size}};
}

utils::BasicResult<DispatchError, StitchResponse> HttpWorkerClient::StartJob(const std::string &worker,
                                                                             const StitchRequest &request) {
  const auto url = fmt::format("http://{}/api/v1/stitch_grid_cell", worker);
  spdlog::trace("Sending session {} to {}", request.session_id, url);

  const auto response = requests::PostJson(url, nlohmann::json(request), timeout_in_seconds_);
  if (!response) return DispatchError::WORKER_UNREACHABLE;

  if (response->status_code < 200 || response->status_code >= 300) {
    spdlog::warn("Worker {} answered {} to session {}: {}", worker, response->status_code, request.session_id,
                 response->body);
    return DispatchError::WORKER_REJECTED;
  }

  const auto body = nlohmann::json::parse(response->body, nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("status_url") || !body.at("status_url").is_string()) {
    spdlog::warn("Worker {} acknowledged session {} without a status_url: {}", worker, request.session_id,
                 response->body);
    return DispatchError::MALFORMED_RESPONSE;
  }
  return StitchResponse{.status_url = body.at("status_url").get<std::string>()};
}

}  // namespace stitcher::coordination
