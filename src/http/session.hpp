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

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "http/router.hpp"

namespace stitcher::http {

/// One HTTP/1.1 connection. Requests are read and answered one at a time.
class Session : public std::enable_shared_from_this<Session> {
 public:
  template <typename... Args>
  static std::shared_ptr<Session> Create(Args &&...args) {
    return std::shared_ptr<Session>{new Session{std::forward<Args>(args)...}};
  }

  void Run();

 private:
  Session(boost::asio::ip::tcp::socket &&socket, const Router &router);

  void DoRead();
  void OnRead(boost::beast::error_code ec, size_t bytes_transferred);
  void OnWrite(bool close, boost::beast::error_code ec, size_t bytes_transferred);
  void DoClose();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> request_;
  std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> response_;
  const Router &router_;
};

}  // namespace stitcher::http
