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

#include "http/listener.hpp"

#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <spdlog/spdlog.h>

#include "http/session.hpp"

namespace stitcher::http {

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

Listener::Listener(net::io_context &ioc, const tcp::endpoint &endpoint, const Router &router)
    : ioc_(ioc), acceptor_(ioc), router_(router) {
  boost::beast::error_code ec;
  auto const check = [&](std::string_view what) {
    if (ec) {
      throw HttpServerError("HTTP listener failed to {} {}:{}: {}", what, endpoint.address().to_string(),
                            endpoint.port(), ec.message());
    }
  };

  acceptor_.open(endpoint.protocol(), ec);
  check("open");
  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  check("configure");
  acceptor_.bind(endpoint, ec);
  check("bind");
  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  check("listen on");
}

void Listener::Run() { DoAccept(); }

void Listener::DoAccept() {
  acceptor_.async_accept(net::make_strand(ioc_),
                         boost::beast::bind_front_handler(&Listener::OnAccept, shared_from_this()));
}

void Listener::OnAccept(boost::beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) return;
  if (ec) {
    spdlog::warn("HTTP listener failed to accept: {}", ec.message());
  } else {
    Session::Create(std::move(socket), router_)->Run();
  }
  DoAccept();
}

}  // namespace stitcher::http
