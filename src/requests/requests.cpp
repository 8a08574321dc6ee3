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

#include "requests/requests.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <gflags/gflags.h>
#include <nlohmann/json.hpp>

#include "spdlog/spdlog.h"

namespace stitcher::requests {

namespace {

size_t CurlWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body = static_cast<std::string *>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

std::optional<Response> Perform(CURL *curl, const std::string &url) {
  Response response;
  std::string user_agent = fmt::format("nci-stitcher/{}", gflags::VersionString());

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1);

  auto res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

  if (res != CURLE_OK) {
    spdlog::warn("Couldn't perform request to {}: {}", url, curl_easy_strerror(res));
    return std::nullopt;
  }
  return response;
}

}  // namespace

void Init() { curl_global_init(CURL_GLOBAL_ALL); }

std::optional<Response> PostJson(const std::string &url, const nlohmann::json &data, int timeout_in_seconds) {
  CURL *curl = curl_easy_init();
  if (!curl) {
    spdlog::error("requests: Couldn't init curl");
    return std::nullopt;
  }

  struct curl_slist *headers = nullptr;
  std::string payload = data.dump();

  headers = curl_slist_append(headers, "Accept: application/json");
  headers = curl_slist_append(headers, "Content-Type: application/json");
  headers = curl_slist_append(headers, "charsets: utf-8");

  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "POST");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_in_seconds);

  auto response = Perform(curl, url);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return response;
}

}  // namespace stitcher::requests
