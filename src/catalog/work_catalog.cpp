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

#include "catalog/work_catalog.hpp"

#include <chrono>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/logging.hpp"

namespace stitcher::catalog {

namespace {
constexpr std::string_view kItemPrefix = "job_status/";
constexpr std::string_view kCreatedKey = "meta/created";
constexpr size_t kWriteBatchSize = 10000;

std::optional<WorkItem> ParseItem(std::string_view key, std::string_view value) {
  try {
    return nlohmann::json::parse(value).get<WorkItem>();
  } catch (const nlohmann::json::exception &e) {
    spdlog::error("Work catalog row {} is corrupted: {}", key, e.what());
    return std::nullopt;
  }
}
}  // namespace

WorkCatalog::WorkCatalog(const std::filesystem::path &storage) {
  try {
    store_ = std::make_unique<kvstore::KVStore>(storage);
  } catch (const kvstore::KVStoreError &e) {
    throw CatalogInitError("Couldn't open work catalog at {}: {}", storage.string(), e.what());
  }
  const auto counts = ScanCounts();
  total_ = counts.total;
  stitched_ = counts.stitched;
}

std::string WorkCatalog::ItemKey(const JobPayload &payload) {
  return fmt::format("{}{}/{}/{:010.6f}/{:010.6f}", kItemPrefix, payload.scenario_id, payload.raster_id,
                     payload.bounds.lat_min + 90.0, payload.bounds.lng_min + 180.0);
}

void WorkCatalog::Initialize(const std::vector<std::string> &scenarios, const std::vector<std::string> &rasters,
                             double grid_step) {
  if (!IsValidGridStep(grid_step)) {
    throw CatalogInitError("Grid step {} doesn't divide 180 degrees evenly.", grid_step);
  }
  if (scenarios.empty() || rasters.empty()) {
    throw CatalogInitError("Work catalog needs at least one scenario and one raster kind.");
  }

  auto guard = std::lock_guard{write_mutex_};
  if (!Store().Delete(kCreatedKey) || !Store().DeletePrefix(kItemPrefix)) {
    throw CatalogInitError("Couldn't drop the existing work catalog.");
  }
  total_ = 0;
  stitched_ = 0;

  const auto cells = GenerateGrid(grid_step);
  uint64_t written = 0;
  std::vector<std::pair<std::string, std::string>> batch;
  batch.reserve(kWriteBatchSize);
  auto flush = [&] {
    if (batch.empty()) return;
    if (!Store().PutBatch(batch)) {
      throw CatalogInitError("Couldn't write work catalog batch after {} items.", written);
    }
    written += batch.size();
    total_ = written;
    batch.clear();
  };

  for (const auto &scenario : scenarios) {
    for (const auto &raster : rasters) {
      for (const auto &cell : cells) {
        WorkItem item{.payload = {.scenario_id = scenario, .raster_id = raster, .bounds = cell}, .stitched = false};
        batch.emplace_back(ItemKey(item.payload), nlohmann::json(item).dump());
        if (batch.size() >= kWriteBatchSize) flush();
      }
    }
  }
  flush();

  const auto created_at = fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
  if (!Store().Put(kCreatedKey, created_at)) {
    throw CatalogInitError("Couldn't write work catalog creation marker.");
  }
  spdlog::info("Work catalog initialized with {} items ({} scenarios, {} rasters, {} cells).", written,
               scenarios.size(), rasters.size(), cells.size());
}

bool WorkCatalog::IsInitialized() const { return Store().Get(kCreatedKey).has_value(); }

std::optional<std::string> WorkCatalog::CreatedAt() const { return Store().Get(kCreatedKey); }

std::vector<WorkItem> WorkCatalog::ReadBacklog() const {
  std::vector<WorkItem> backlog;
  const bool complete = Store().Scan(kItemPrefix, [&](std::string_view key, std::string_view value) {
    auto item = ParseItem(key, value);
    if (item && !item->stitched) backlog.push_back(std::move(*item));
  });
  if (!complete) spdlog::error("Work catalog backlog read stopped early, {} items read.", backlog.size());
  return backlog;
}

std::optional<WorkItem> WorkCatalog::Get(const JobPayload &payload) const {
  const auto key = ItemKey(payload);
  const auto value = Store().Get(key);
  if (!value) return std::nullopt;
  auto item = ParseItem(key, *value);
  // The key only encodes the min corner, the stored row must match the rest.
  if (item && !(item->payload == payload)) return std::nullopt;
  return item;
}

bool WorkCatalog::MarkStitched(const JobPayload &payload) {
  auto guard = std::lock_guard{write_mutex_};
  auto item = Get(payload);
  if (!item) {
    spdlog::warn("Can't mark unknown work item {} as stitched.", ItemKey(payload));
    return false;
  }
  if (item->stitched) return true;
  item->stitched = true;
  if (!Store().Put(ItemKey(payload), nlohmann::json(*item).dump())) return false;
  ++stitched_;
  return true;
}

CatalogCounts WorkCatalog::Counts() const { return {.total = total_.load(), .stitched = stitched_.load()}; }

CatalogCounts WorkCatalog::ScanCounts() const {
  CatalogCounts counts;
  const bool complete = Store().Scan(kItemPrefix, [&counts](std::string_view key, std::string_view value) {
    auto item = ParseItem(key, value);
    if (!item) return;
    ++counts.total;
    if (item->stitched) ++counts.stitched;
  });
  if (!complete) spdlog::error("Work catalog count stopped early at {} items.", counts.total);
  return counts;
}

}  // namespace stitcher::catalog
