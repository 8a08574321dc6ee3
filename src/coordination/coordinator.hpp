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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog/work_catalog.hpp"
#include "coordination/completion_handler.hpp"
#include "coordination/dispatcher.hpp"
#include "coordination/fleet_discovery.hpp"
#include "coordination/host_source.hpp"
#include "coordination/queues.hpp"
#include "coordination/session_table.hpp"
#include "coordination/worker_client.hpp"
#include "coordination/worker_registry.hpp"
#include "http/server.hpp"

namespace stitcher::coordination {

struct CoordinatorConfig {
  std::filesystem::path data_directory;
  bool reinitialize_catalog{false};
  std::vector<std::string> scenarios;
  std::vector<std::string> rasters;
  double grid_step{2.0};

  std::string app_address{"0.0.0.0"};
  uint16_t app_port{8080};
  size_t http_threads{2};

  std::chrono::seconds discovery_interval{30};
  DispatcherConfig dispatcher;
  // Completion bodies kept for downstream consumers, 0 means unbounded.
  size_t result_queue_size{10000};
};

/**
 * Owns every piece of coordinator state and the threads working on it:
 * the HTTP server threads, the fleet discovery scheduler and the dispatcher.
 */
class Coordinator final {
 public:
  /// @throw catalog::CatalogInitError if the catalog can't be opened.
  /// @throw http::HttpServerError if the HTTP endpoint can't be bound.
  Coordinator(CoordinatorConfig config, std::unique_ptr<HostSource> host_source,
              std::unique_ptr<WorkerClient> worker_client);

  Coordinator(const Coordinator &) = delete;
  Coordinator &operator=(const Coordinator &) = delete;
  Coordinator(Coordinator &&) = delete;
  Coordinator &operator=(Coordinator &&) = delete;
  ~Coordinator();

  /**
   * Creates the catalog unless an initialized one is reused, then starts the
   * HTTP server, fleet discovery and the dispatcher, in that order.
   *
   * @throw catalog::CatalogInitError
   */
  void Start();

  /// Asks every loop to stop. Doesn't wait.
  void Shutdown();

  /// Blocks until Shutdown is called, then joins every thread started by Start.
  void AwaitShutdown();

  nlohmann::json Stats();

  boost::asio::ip::tcp::endpoint GetEndpoint() const { return server_.GetEndpoint(); }

  catalog::WorkCatalog &Catalog() { return catalog_; }
  WorkerRegistry &Registry() { return registry_; }
  SessionTable &Sessions() { return sessions_; }
  RescheduleQueue &Reschedule() { return reschedule_; }
  ResultQueue &Results() { return results_; }

 private:
  void PrepareCatalog();
  http::Router BuildRouter();

  CoordinatorConfig config_;
  catalog::WorkCatalog catalog_;
  WorkerRegistry registry_;
  SessionTable sessions_;
  RescheduleQueue reschedule_;
  ResultQueue results_;
  std::unique_ptr<HostSource> host_source_;
  std::unique_ptr<WorkerClient> worker_client_;
  FleetDiscovery discovery_;
  Dispatcher dispatcher_;
  CompletionHandler completion_handler_;
  http::Server server_;
};

}  // namespace stitcher::coordination
