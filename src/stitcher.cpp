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

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>

#include <fmt/format.h>
#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include "catalog/work_catalog.hpp"
#include "coordination/coordinator.hpp"
#include "coordination/ec2_host_source.hpp"
#include "coordination/host_source.hpp"
#include "coordination/worker_client.hpp"
#include "flags/coordination.hpp"
#include "flags/general.hpp"
#include "flags/log_level.hpp"
#include "http/listener.hpp"
#include "requests/requests.hpp"
#include "utils/logging.hpp"
#include "utils/signals.hpp"
#include "utils/string.hpp"

#ifndef STITCHER_VERSION
#define STITCHER_VERSION "unknown"
#endif

namespace {

// Needed to correctly handle coordinator destruction from a signal handler.
// Without having some sort of a flag, it is possible that a signal is handled
// when we are exiting main, inside destructors of the coordinator. The signal
// handler may then initiate another shutdown on a half destructed
// coordinator, causing invalid memory access and crash.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t is_shutting_down = 0;

void InitSignalHandlers(const std::function<void()> &shutdown_fun) {
  // Prevent handling shutdown inside a shutdown. For example, SIGINT handler
  // being interrupted by SIGTERM before is_shutting_down is set, thus causing
  // double shutdown.
  sigset_t block_shutdown_signals;
  sigemptyset(&block_shutdown_signals);
  sigaddset(&block_shutdown_signals, SIGTERM);
  sigaddset(&block_shutdown_signals, SIGINT);

  // Wrap the shutdown function in a safe way to prevent recursive shutdown.
  auto shutdown = [shutdown_fun]() {
    if (is_shutting_down) return;
    is_shutting_down = 1;
    shutdown_fun();
  };

  ST_ASSERT(stitcher::utils::SignalHandler::RegisterHandler(stitcher::utils::Signal::Terminate, shutdown,
                                                            block_shutdown_signals),
            "Unable to register SIGTERM handler!");
  ST_ASSERT(stitcher::utils::SignalHandler::RegisterHandler(stitcher::utils::Signal::Interrupt, shutdown,
                                                            block_shutdown_signals),
            "Unable to register SIGINT handler!");
}

std::unique_ptr<stitcher::coordination::HostSource> MakeHostSource() {
  auto workers = stitcher::flags::ParseWorkerList();
  if (!workers.empty()) {
    spdlog::info("Using the static worker list: {}", stitcher::utils::Join(workers, ", "));
    return std::make_unique<stitcher::coordination::StaticHostSource>(workers);
  }
  spdlog::info("Discovering EC2 workers tagged {}.", FLAGS_worker_tag);
  return std::make_unique<stitcher::coordination::Ec2HostSource>(stitcher::coordination::Ec2HostSourceConfig{
      .aws_region = FLAGS_aws_region, .worker_tag = FLAGS_worker_tag, .worker_port = FLAGS_worker_port});
}

stitcher::coordination::CoordinatorConfig MakeCoordinatorConfig() {
  return stitcher::coordination::CoordinatorConfig{
      .data_directory = FLAGS_data_directory,
      .reinitialize_catalog = FLAGS_reinitialize_catalog,
      .scenarios = stitcher::flags::ParseScenarioList(),
      .rasters = stitcher::flags::ParseRasterList(),
      .grid_step = FLAGS_grid_step,
      .app_address = FLAGS_app_address,
      .app_port = static_cast<uint16_t>(FLAGS_app_port),
      .http_threads = static_cast<size_t>(FLAGS_http_threads),
      .discovery_interval = std::chrono::seconds(FLAGS_discovery_interval_sec),
      .dispatcher = {.callback_url = fmt::format("http://{}:{}/api/v1/processing_complete", FLAGS_external_address,
                                                 stitcher::flags::ExternalPort()),
                     .bucket_uri_prefix = FLAGS_bucket_uri_prefix,
                     .wgs84_pixel_size = FLAGS_wgs84_pixel_size,
                     .retry_policy = {}},
      .result_queue_size = static_cast<size_t>(FLAGS_result_queue_size)};
}

}  // namespace

int main(int argc, char **argv) {
  google::SetUsageMessage("Grid stitching master coordinator");
  gflags::SetVersionString(STITCHER_VERSION);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_h) {
    gflags::ShowUsageWithFlags(argv[0]);
    exit(1);
  }

  stitcher::flags::InitializeLogger();

  // Workers that hang up mid response must not kill the coordinator.
  ST_ASSERT(stitcher::utils::SignalIgnore(stitcher::utils::Signal::Pipe), "Couldn't ignore SIGPIPE!");

  stitcher::requests::Init();

  std::unique_ptr<stitcher::coordination::Coordinator> coordinator;
  try {
    coordinator = std::make_unique<stitcher::coordination::Coordinator>(
        MakeCoordinatorConfig(), MakeHostSource(),
        std::make_unique<stitcher::coordination::HttpWorkerClient>(FLAGS_dispatch_timeout_sec));
  } catch (const stitcher::utils::BasicException &e) {
    spdlog::critical("{}: {}", e.name(), e.what());
    return EXIT_FAILURE;
  }

  InitSignalHandlers([&coordinator] {
    spdlog::info("Coordinator shutting down.");
    coordinator->Shutdown();
  });
  spdlog::trace("Signal handlers initialized.");

  try {
    coordinator->Start();
  } catch (const stitcher::catalog::CatalogInitError &e) {
    spdlog::critical("Work catalog initialization failed: {}", e.what());
    coordinator->Shutdown();
    return EXIT_FAILURE;
  }

  coordinator->AwaitShutdown();
  spdlog::info("Coordinator stopped.");
  return 0;
}
