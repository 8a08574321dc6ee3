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

#include "http/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <spdlog/spdlog.h>

#include "utils/thread.hpp"

namespace stitcher::http {

Server::Server(const std::string &address, uint16_t port, Router router, size_t threads)
    : ioc_(static_cast<int>(threads)), router_(std::move(router)), threads_count_(threads) {
  boost::system::error_code ec;
  const auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) throw HttpServerError("Invalid HTTP listen address {}: {}", address, ec.message());
  listener_ = Listener::Create(ioc_, boost::asio::ip::tcp::endpoint{ip, port}, router_);
}

Server::~Server() {
  if (IsRunning()) Shutdown();
  AwaitShutdown();
}

void Server::Start() {
  listener_->Run();
  threads_.reserve(threads_count_);
  for (size_t i = 0; i < threads_count_; ++i) {
    threads_.emplace_back([this] {
      utils::ThreadSetName("HTTP server");
      ioc_.run();
    });
  }
  const auto endpoint = GetEndpoint();
  spdlog::info("HTTP server is listening on {}:{}", endpoint.address().to_string(), endpoint.port());
}

void Server::Shutdown() { ioc_.stop(); }

void Server::AwaitShutdown() {
  for (auto &thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

bool Server::IsRunning() const { return !threads_.empty() && !ioc_.stopped(); }

boost::asio::ip::tcp::endpoint Server::GetEndpoint() const { return listener_->GetEndpoint(); }

}  // namespace stitcher::http
