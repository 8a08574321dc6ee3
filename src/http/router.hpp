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

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <nlohmann/json_fwd.hpp>

namespace stitcher::http {

struct Request {
  boost::beast::http::verb method;
  // Path without the query string.
  std::string path;
  std::string body;
};

struct Response {
  boost::beast::http::status status{boost::beast::http::status::ok};
  std::string body;
  std::string content_type{"text/plain"};

  static Response Text(boost::beast::http::status status, std::string body);
  static Response Json(boost::beast::http::status status, const nlohmann::json &body);
  static Response Error(boost::beast::http::status status, std::string_view message);
};

/// Maps (method, path) to a handler. Paths are matched exactly.
class Router {
 public:
  using Handler = std::function<Response(const Request &)>;

  void Add(boost::beast::http::verb method, std::string path, Handler handler);

  /// Unknown path gives 404, known path with another method gives 405.
  Response Route(const Request &request) const;

 private:
  std::map<std::string, std::map<boost::beast::http::verb, Handler>, std::less<>> routes_;
};

}  // namespace stitcher::http
