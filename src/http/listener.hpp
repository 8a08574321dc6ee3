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

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include "http/router.hpp"
#include "utils/exceptions.hpp"

namespace stitcher::http {

/// The listening socket couldn't be set up.
class HttpServerError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(HttpServerError)
};

/// Accepts connections and spawns a Session for each.
class Listener : public std::enable_shared_from_this<Listener> {
 public:
  template <typename... Args>
  static std::shared_ptr<Listener> Create(Args &&...args) {
    return std::shared_ptr<Listener>{new Listener(std::forward<Args>(args)...)};
  }

  void Run();

  boost::asio::ip::tcp::endpoint GetEndpoint() const { return acceptor_.local_endpoint(); }

 private:
  /// @throw HttpServerError if the endpoint can't be bound.
  Listener(boost::asio::io_context &ioc, const boost::asio::ip::tcp::endpoint &endpoint, const Router &router);

  void DoAccept();
  void OnAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context &ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  const Router &router_;
};

}  // namespace stitcher::http
