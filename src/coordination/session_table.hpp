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
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/work_item.hpp"
#include "utils/synchronized.hpp"

namespace stitcher::coordination {

/// An in-flight dispatch: which worker runs which job.
struct Session {
  std::string session_id;
  std::string worker;
  catalog::JobPayload payload;
  // Empty until the worker acknowledged the job.
  std::string status_url;
  std::chrono::system_clock::time_point created_at;
};

/**
 * Open sessions by id.
 *
 * A session is resolved by removing it with Take or TakeAllForWorker. Both
 * remove under the table lock, so each session is handed out at most once no
 * matter how completion callbacks and dead-host sweeps interleave.
 */
class SessionTable {
 public:
  /// @return false if a session with the same id already exists.
  bool Insert(Session session);

  /// Removes and returns the session.
  std::optional<Session> Take(const std::string &session_id);

  /// Removes and returns every session bound to `worker`.
  std::vector<Session> TakeAllForWorker(const std::string &worker);

  /// @return false if the session doesn't exist anymore.
  bool SetStatusUrl(const std::string &session_id, const std::string &status_url);

  bool Contains(const std::string &session_id) const;
  std::optional<Session> Find(const std::string &session_id) const;
  size_t Size() const;

 private:
  utils::Synchronized<std::unordered_map<std::string, Session>, std::shared_mutex> sessions_;
};

}  // namespace stitcher::coordination
