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

#include <string>
#include <unordered_set>
#include <vector>

#include "utils/exceptions.hpp"

namespace stitcher::coordination {

/// The host listing source is unreachable or returned malformed data.
class DiscoveryError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(DiscoveryError)
};

/// Authoritative list of the workers that currently exist.
class HostSource {
 public:
  HostSource() = default;
  HostSource(const HostSource &) = delete;
  HostSource &operator=(const HostSource &) = delete;
  HostSource(HostSource &&) = delete;
  HostSource &operator=(HostSource &&) = delete;
  virtual ~HostSource() = default;

  /// @return `host:port` of every live worker.
  /// @throw DiscoveryError
  virtual std::unordered_set<std::string> ListWorkerHosts() = 0;

  /// A static source never changes, so it has to be reconciled only once.
  virtual bool IsStatic() const = 0;
};

/// Fixed worker list, used for local and offline runs.
class StaticHostSource final : public HostSource {
 public:
  explicit StaticHostSource(const std::vector<std::string> &hosts) : hosts_(hosts.begin(), hosts.end()) {}

  std::unordered_set<std::string> ListWorkerHosts() override { return hosts_; }
  bool IsStatic() const override { return true; }

 private:
  std::unordered_set<std::string> hosts_;
};

}  // namespace stitcher::coordination
