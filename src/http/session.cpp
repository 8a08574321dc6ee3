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

#include "http/session.hpp"

#include <chrono>

#include <boost/asio/dispatch.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <spdlog/spdlog.h>

namespace stitcher::http {

namespace beast = boost::beast;
namespace beast_http = boost::beast::http;

namespace {
constexpr auto kSessionTimeout = std::chrono::seconds(30);
}  // namespace

Session::Session(boost::asio::ip::tcp::socket &&socket, const Router &router)
    : stream_(std::move(socket)), router_(router) {}

void Session::Run() {
  boost::asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::DoRead, shared_from_this()));
}

void Session::DoRead() {
  request_ = {};
  stream_.expires_after(kSessionTimeout);
  beast_http::async_read(stream_, buffer_, request_, beast::bind_front_handler(&Session::OnRead, shared_from_this()));
}

void Session::OnRead(beast::error_code ec, size_t /*bytes_transferred*/) {
  if (ec == beast_http::error::end_of_stream) {
    return DoClose();
  }
  if (ec) {
    if (ec != beast::error::timeout) spdlog::warn("HTTP session read failed: {}", ec.message());
    return;
  }

  const auto target = std::string_view(request_.target().data(), request_.target().size());
  const Request request{.method = request_.method(),
                        .path = std::string(target.substr(0, target.find('?'))),
                        .body = std::move(request_.body())};
  auto routed = router_.Route(request);
  const auto method = request_.method_string();
  spdlog::trace("HTTP {} {} -> {}", std::string_view(method.data(), method.size()), request.path,
                static_cast<unsigned>(routed.status));

  response_ = std::make_shared<beast_http::response<beast_http::string_body>>(routed.status, request_.version());
  response_->set(beast_http::field::server, BOOST_BEAST_VERSION_STRING);
  response_->set(beast_http::field::content_type, routed.content_type);
  response_->keep_alive(request_.keep_alive());
  response_->body() = std::move(routed.body);
  response_->prepare_payload();

  beast_http::async_write(stream_, *response_,
                          beast::bind_front_handler(&Session::OnWrite, shared_from_this(), response_->need_eof()));
}

void Session::OnWrite(bool close, beast::error_code ec, size_t /*bytes_transferred*/) {
  if (ec) {
    spdlog::warn("HTTP session write failed: {}", ec.message());
    return;
  }
  if (close) {
    return DoClose();
  }
  response_.reset();
  DoRead();
}

void Session::DoClose() {
  beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec && ec != beast::errc::not_connected) {
    spdlog::debug("HTTP session shutdown failed: {}", ec.message());
  }
}

}  // namespace stitcher::http
