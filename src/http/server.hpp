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

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "http/listener.hpp"
#include "http/router.hpp"

namespace stitcher::http {

/**
 * HTTP server running its io_context on `threads` threads. The endpoint is
 * bound in the constructor, so port 0 resolves to a real port right away.
 */
class Server final {
 public:
  /// @throw HttpServerError if the endpoint can't be bound.
  Server(const std::string &address, uint16_t port, Router router, size_t threads = 1);

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;
  ~Server();

  void Start();
  void Shutdown();
  void AwaitShutdown();
  bool IsRunning() const;

  boost::asio::ip::tcp::endpoint GetEndpoint() const;

 private:
  boost::asio::io_context ioc_;
  Router router_;
  size_t threads_count_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::jthread> threads_;
};

}  // namespace stitcher::http
