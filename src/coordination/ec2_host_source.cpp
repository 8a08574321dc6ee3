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

#include "coordination/ec2_host_source.hpp"

#include <aws/core/Aws.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/ec2/EC2Client.h>
#include <aws/ec2/model/DescribeInstancesRequest.h>
#include <aws/ec2/model/Filter.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace stitcher::coordination {

namespace {

class GlobalAwsAPIManager {
 public:
  GlobalAwsAPIManager(const GlobalAwsAPIManager &) = delete;
  GlobalAwsAPIManager &operator=(const GlobalAwsAPIManager &) = delete;
  GlobalAwsAPIManager(GlobalAwsAPIManager &&) = delete;
  GlobalAwsAPIManager &operator=(GlobalAwsAPIManager &&) = delete;

  static GlobalAwsAPIManager &GetInstance() {
    static GlobalAwsAPIManager instance;
    return instance;
  }

 private:
  GlobalAwsAPIManager() { Aws::InitAPI(options); }
  ~GlobalAwsAPIManager() { Aws::ShutdownAPI(options); }

  Aws::SDKOptions options;
};

auto BuildClientConfiguration(std::string const &aws_region) -> Aws::Client::ClientConfiguration {
  Aws::Client::ClientConfiguration client_config;
  if (!aws_region.empty()) {
    client_config.region = aws_region;
  }
  return client_config;
}

auto BuildFilter(std::string const &name, std::string const &value) -> Aws::EC2::Model::Filter {
  Aws::EC2::Model::Filter filter;
  filter.SetName(name);
  filter.AddValues(value);
  return filter;
}

}  // namespace

struct Ec2HostSource::impl {
  explicit impl(std::string const &aws_region) : client(BuildClientConfiguration(aws_region)) {}

  Aws::EC2::EC2Client client;
};

Ec2HostSource::Ec2HostSource(Ec2HostSourceConfig config) : config_(std::move(config)) {
  GlobalAwsAPIManager::GetInstance();
  pimpl_ = std::make_unique<impl>(config_.aws_region);
}

Ec2HostSource::~Ec2HostSource() = default;

std::unordered_set<std::string> Ec2HostSource::ListWorkerHosts() {
  Aws::EC2::Model::DescribeInstancesRequest request;
  request.AddFilters(BuildFilter("instance-state-name", "running"));
  request.AddFilters(BuildFilter("tag-value", config_.worker_tag));

  std::unordered_set<std::string> hosts;
  Aws::String next_token;
  do {
    if (!next_token.empty()) request.SetNextToken(next_token);
    auto outcome = pimpl_->client.DescribeInstances(request);
    if (!outcome.IsSuccess()) {
      throw DiscoveryError("EC2 DescribeInstances failed. Error: {}", outcome.GetError().GetMessage());
    }
    const auto &result = outcome.GetResult();
    for (const auto &reservation : result.GetReservations()) {
      for (const auto &instance : reservation.GetInstances()) {
        const auto &address = instance.GetPrivateIpAddress();
        if (address.empty()) {
          spdlog::warn("Worker instance {} has no private IP address, skipping it.", instance.GetInstanceId());
          continue;
        }
        hosts.insert(fmt::format("{}:{}", address, config_.worker_port));
      }
    }
    next_token = result.GetNextToken();
  } while (!next_token.empty());

  spdlog::trace("EC2 reported {} worker instances tagged {}.", hosts.size(), config_.worker_tag);
  return hosts;
}

}  // namespace stitcher::coordination
