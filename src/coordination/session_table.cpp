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

#include "coordination/session_table.hpp"

namespace stitcher::coordination {

bool SessionTable::Insert(Session session) {
  auto id = session.session_id;
  return sessions_->try_emplace(std::move(id), std::move(session)).second;
}

std::optional<Session> SessionTable::Take(const std::string &session_id) {
  auto locked = sessions_.Lock();
  auto node = locked->extract(session_id);
  if (node.empty()) return std::nullopt;
  return std::move(node.mapped());
}

std::vector<Session> SessionTable::TakeAllForWorker(const std::string &worker) {
  return sessions_.WithLock([&](auto &sessions) {
    std::vector<Session> taken;
    for (auto it = sessions.begin(); it != sessions.end();) {
      if (it->second.worker != worker) {
        ++it;
        continue;
      }
      taken.push_back(std::move(it->second));
      it = sessions.erase(it);
    }
    return taken;
  });
}

bool SessionTable::SetStatusUrl(const std::string &session_id, const std::string &status_url) {
  auto locked = sessions_.Lock();
  auto it = locked->find(session_id);
  if (it == locked->end()) return false;
  it->second.status_url = status_url;
  return true;
}

bool SessionTable::Contains(const std::string &session_id) const {
  return sessions_.WithReadLock([&](const auto &sessions) { return sessions.contains(session_id); });
}

std::optional<Session> SessionTable::Find(const std::string &session_id) const {
  auto locked = sessions_.ReadLock();
  auto it = locked->find(session_id);
  if (it == locked->end()) return std::nullopt;
  return it->second;
}

size_t SessionTable::Size() const { return sessions_->size(); }

}  // namespace stitcher::coordination
