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
#include <string_view>

#include <nlohmann/json.hpp>

#include "catalog/work_catalog.hpp"
#include "coordination/queues.hpp"
#include "coordination/session_table.hpp"
#include "coordination/worker_registry.hpp"
#include "utils/result.hpp"

namespace stitcher::coordination {

enum class CompletionError : uint8_t {
  // Already resolved, swept with its dead worker, or never existed.
  UNKNOWN_SESSION,
  // Not a JSON object with a string `session_id`.
  MALFORMED_REQUEST,
};

std::string_view CompletionErrorToString(CompletionError error);

/// Closes sessions reported done by workers.
class CompletionHandler {
 public:
  CompletionHandler(catalog::WorkCatalog &catalog, WorkerRegistry &registry, SessionTable &sessions,
                    ResultQueue &results);

  /**
   * Takes the session named by `body["session_id"]`, marks its work item as
   * stitched, queues `body` as the result and releases the worker. An unknown
   * session changes nothing. The result is dropped, and counted, if the
   * result queue is full.
   */
  utils::BasicResult<CompletionError> Handle(const nlohmann::json &body);

  /// Parses `raw_body` and forwards it to Handle.
  utils::BasicResult<CompletionError> HandleRaw(std::string_view raw_body);

  uint64_t DroppedResults() const { return dropped_results_.load(); }

 private:
  catalog::WorkCatalog &catalog_;
  WorkerRegistry &registry_;
  SessionTable &sessions_;
  ResultQueue &results_;
  std::atomic<uint64_t> dropped_results_{0};
};

}  // namespace stitcher::coordination
