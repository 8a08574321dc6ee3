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

#include "coordination/completion_handler.hpp"

#include <spdlog/spdlog.h>

namespace stitcher::coordination {

std::string_view CompletionErrorToString(CompletionError error) {
  switch (error) {
    case CompletionError::UNKNOWN_SESSION:
      return "unknown session";
    case CompletionError::MALFORMED_REQUEST:
      return "malformed request";
  }
  return "unknown completion error";
}

CompletionHandler::CompletionHandler(catalog::WorkCatalog &catalog, WorkerRegistry &registry, SessionTable &sessions,
                                     ResultQueue &results)
    : catalog_(catalog), registry_(registry), sessions_(sessions), results_(results) {}

utils::BasicResult<CompletionError> CompletionHandler::Handle(const nlohmann::json &body) {
  if (!body.is_object() || !body.contains("session_id") || !body.at("session_id").is_string()) {
    spdlog::warn("Completion callback without a session_id: {}", body.dump());
    return CompletionError::MALFORMED_REQUEST;
  }
  const auto session_id = body.at("session_id").get<std::string>();

  auto session = sessions_.Take(session_id);
  if (!session) {
    spdlog::warn("Completion callback for unknown session {}, open sessions: {}.", session_id, sessions_.Size());
    return CompletionError::UNKNOWN_SESSION;
  }

  if (!catalog_.MarkStitched(session->payload)) {
    spdlog::error("Session {} completed but its work item couldn't be marked as stitched.", session_id);
  }
  if (!results_.try_push(body)) {
    if (dropped_results_++ == 0) {
      spdlog::warn("Result queue is full or closed, completion results are dropped from session {} on.", session_id);
    }
  }
  registry_.Release(session->worker);

  spdlog::info("Session {} completed on {}.", session_id, session->worker);
  return {};
}

utils::BasicResult<CompletionError> CompletionHandler::HandleRaw(std::string_view raw_body) {
  auto body = nlohmann::json::parse(raw_body, nullptr, false);
  if (body.is_discarded()) {
    spdlog::warn("Completion callback body isn't JSON.");
    return CompletionError::MALFORMED_REQUEST;
  }
  return Handle(body);
}

}  // namespace stitcher::coordination
