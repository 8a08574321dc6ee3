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

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "catalog/work_item.hpp"
#include "kvstore/kvstore.hpp"
#include "utils/exceptions.hpp"

namespace stitcher::catalog {

/// The catalog couldn't be opened or (re)created. Fatal at startup.
class CatalogInitError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(CatalogInitError)
};

struct CatalogCounts {
  uint64_t total{0};
  uint64_t stitched{0};
};

/**
 * Durable table of every WorkItem and its `stitched` flag.
 *
 * Rows are JSON values stored under
 * `job_status/<scenario>/<raster>/<lat_min + 90>/<lng_min + 180>`, with both
 * offsets printed at a fixed width so that, within a (scenario, raster) pair,
 * the key order is the grid order (south to north, west to east).
 * A separate marker key holds the time the catalog was last fully created.
 */
class WorkCatalog final {
 public:
  /// @throw CatalogInitError if the storage can't be opened.
  explicit WorkCatalog(const std::filesystem::path &storage);

  /**
   * Drops every row and the creation marker, then writes the cross product of
   * `scenarios` x `rasters` x GenerateGrid(grid_step) with `stitched` = 0.
   * Rows are written in batches, the creation marker last, so an interrupted
   * initialization leaves the catalog uninitialized.
   *
   * @throw CatalogInitError on an invalid grid step, empty lists or a failed write.
   */
  void Initialize(const std::vector<std::string> &scenarios, const std::vector<std::string> &rasters,
                  double grid_step);

  /// True if a previous Initialize ran to completion.
  bool IsInitialized() const;

  /// Time at which the catalog was created, as written by Initialize.
  std::optional<std::string> CreatedAt() const;

  /// Every item with `stitched` = 0, in key order. Reads from a point in time
  /// view and doesn't block writers.
  std::vector<WorkItem> ReadBacklog() const;

  /// Looks up the item identified by `payload`.
  std::optional<WorkItem> Get(const JobPayload &payload) const;

  /**
   * Sets `stitched` = 1 for the item identified by `payload`.
   * @return false if no such item exists or the write failed.
   */
  bool MarkStitched(const JobPayload &payload);

  /// Totals kept up to date by Initialize and MarkStitched, no storage access.
  CatalogCounts Counts() const;

  static std::string ItemKey(const JobPayload &payload);

 private:
  kvstore::KVStore &Store() const { return *store_; }
  CatalogCounts ScanCounts() const;

  std::unique_ptr<kvstore::KVStore> store_;
  // Serializes the read-modify-write of MarkStitched with Initialize.
  std::mutex write_mutex_;
  std::atomic<uint64_t> total_{0};
  std::atomic<uint64_t> stitched_{0};
};

}  // namespace stitcher::catalog
