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

#include "http/router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace stitcher::http {

namespace beast_http = boost::beast::http;

Response Response::Text(beast_http::status status, std::string body) {
  return Response{.status = status, .body = std::move(body), .content_type = "text/plain"};
}

Response Response::Json(beast_http::status status, const nlohmann::json &body) {
  return Response{.status = status, .body = body.dump(), .content_type = "application/json"};
}

Response Response::Error(beast_http::status status, std::string_view message) {
  return Json(status, nlohmann::json{{"error", std::string(message)}});
}

void Router::Add(beast_http::verb method, std::string path, Handler handler) {
  routes_[std::move(path)][method] = std::move(handler);
}

Response Router::Route(const Request &request) const {
  auto path_it = routes_.find(request.path);
  if (path_it == routes_.end()) {
    return Response::Error(beast_http::status::not_found, "Unknown route");
  }
  auto handler_it = path_it->second.find(request.method);
  if (handler_it == path_it->second.end()) {
    return Response::Error(beast_http::status::method_not_allowed, "Method not allowed");
  }
  try {
    return handler_it->second(request);
  } catch (const std::exception &e) {
    const auto method = beast_http::to_string(request.method);
    spdlog::error("Handler for {} {} failed: {}", std::string_view(method.data(), method.size()), request.path,
                  e.what());
    return Response::Error(beast_http::status::internal_server_error, "Internal error");
  }
}

}  // namespace stitcher::http
