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

#include <memory>
#include <string>
#include <unordered_set>

#include "coordination/host_source.hpp"

namespace stitcher::coordination {

struct Ec2HostSourceConfig {
  // Empty means the SDK default region.
  std::string aws_region;
  std::string worker_tag;
  int worker_port;
};

/**
 * Lists running EC2 instances that carry a tag whose value is the worker tag.
 * Each instance is reported as `PrivateIpAddress:worker_port`.
 */
class Ec2HostSource final : public HostSource {
 public:
  explicit Ec2HostSource(Ec2HostSourceConfig config);
  ~Ec2HostSource() override;

  std::unordered_set<std::string> ListWorkerHosts() override;
  bool IsStatic() const override { return false; }

 private:
  Ec2HostSourceConfig config_;
  struct impl;
  std::unique_ptr<impl> pimpl_;
};

}  // namespace stitcher::coordination
