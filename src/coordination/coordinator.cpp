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

#include "coordination/coordinator.hpp"

#include <spdlog/spdlog.h>

namespace stitcher::coordination {

namespace beast_http = boost::beast::http;

Coordinator::Coordinator(CoordinatorConfig config, std::unique_ptr<HostSource> host_source,
                         std::unique_ptr<WorkerClient> worker_client)
    : config_(std::move(config)),
      catalog_(config_.data_directory / "work_catalog"),
      results_(config_.result_queue_size),
      host_source_(std::move(host_source)),
      worker_client_(std::move(worker_client)),
      discovery_(*host_source_, registry_, sessions_, reschedule_, config_.discovery_interval),
      dispatcher_(catalog_, registry_, sessions_, reschedule_, *worker_client_, config_.dispatcher),
      completion_handler_(catalog_, registry_, sessions_, results_),
      server_(config_.app_address, config_.app_port, BuildRouter(), config_.http_threads) {}

Coordinator::~Coordinator() {
  Shutdown();
  AwaitShutdown();
}

void Coordinator::PrepareCatalog() {
  if (!config_.reinitialize_catalog && catalog_.IsInitialized()) {
    const auto counts = catalog_.Counts();
    spdlog::info("Resuming work catalog created at {}: {} of {} items stitched.", catalog_.CreatedAt().value_or("?"),
                 counts.stitched, counts.total);
    return;
  }
  spdlog::info("Initializing work catalog in {}.", config_.data_directory.string());
  catalog_.Initialize(config_.scenarios, config_.rasters, config_.grid_step);
}

void Coordinator::Start() {
  PrepareCatalog();
  server_.Start();
  discovery_.Start();
  dispatcher_.Start();
  spdlog::info("Coordinator started, workers call back on {}.", config_.dispatcher.callback_url);
}

void Coordinator::Shutdown() {
  dispatcher_.RequestStop();
  server_.Shutdown();
}

void Coordinator::AwaitShutdown() {
  // Returns once Shutdown stopped the HTTP io_context.
  server_.AwaitShutdown();
  discovery_.Stop();
  dispatcher_.Stop();
  // Nothing produces into the queues anymore.
  reschedule_.finish();
  results_.finish();
}

nlohmann::json Coordinator::Stats() {
  const auto registry = registry_.Counts();
  const auto catalog = catalog_.Counts();
  const auto dispatcher = dispatcher_.Stats();
  return nlohmann::json{
      {"workers", {{"running", registry.running}, {"ready", registry.ready}}},
      {"open_sessions", sessions_.Size()},
      {"reschedule_backlog", reschedule_.size()},
      {"pending_results", results_.size()},
      {"dropped_results", completion_handler_.DroppedResults()},
      {"catalog", {{"total", catalog.total}, {"stitched", catalog.stitched}}},
      {"dispatcher", {{"dispatched", dispatcher.dispatched}, {"failed_attempts", dispatcher.failed_attempts}}}};
}

http::Router Coordinator::BuildRouter() {
  http::Router router;
  router.Add(beast_http::verb::get, "/api/v1/processing_status",
             [](const http::Request & /*request*/) { return http::Response::Text(beast_http::status::ok, "ok"); });

  router.Add(beast_http::verb::post, "/api/v1/processing_complete", [this](const http::Request &request) {
    auto result = completion_handler_.HandleRaw(request.body);
    if (!result.HasError()) {
      return http::Response::Text(beast_http::status::accepted, "complete");
    }
    const auto error = result.GetError();
    switch (error) {
      case CompletionError::UNKNOWN_SESSION:
        return http::Response::Error(beast_http::status::not_found, CompletionErrorToString(error));
      case CompletionError::MALFORMED_REQUEST:
        return http::Response::Error(beast_http::status::bad_request, CompletionErrorToString(error));
    }
    return http::Response::Error(beast_http::status::internal_server_error, CompletionErrorToString(error));
  });

  router.Add(beast_http::verb::get, "/api/v1/stats",
             [this](const http::Request & /*request*/) { return http::Response::Json(beast_http::status::ok, Stats()); });
  return router;
}

}  // namespace stitcher::coordination
