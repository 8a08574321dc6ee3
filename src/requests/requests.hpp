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

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace stitcher::requests {

/**
 * Call this function in each `main` file that uses the Requests stack. It is
 * used to initialize all libraries (primarily cURL).
 *
 * NOTE: This function must be called **exactly** once.
 */
void Init();

struct Response {
  long status_code{0};  // NOLINT
  std::string body;
};

/**
 * This function sends a POST request with a JSON payload to the `url` and
 * collects the response.
 *
 * @param url url to which to send the request
 * @param data json payload
 * @param timeout_in_seconds the timeout that should be used when making the request
 * @return the status code and body of the response, std::nullopt if the
 *         request couldn't be performed at all (connection refused, timeout...).
 */
std::optional<Response> PostJson(const std::string &url, const nlohmann::json &data, int timeout_in_seconds = 10);

}  // namespace stitcher::requests
