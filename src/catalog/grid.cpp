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

#include "catalog/grid.hpp"

#include <cmath>
#include <cstdint>

#include "utils/logging.hpp"

namespace stitcher::catalog {

namespace {
constexpr double kLatExtent = 180.0;
constexpr double kLatOrigin = -90.0;
constexpr double kLngOrigin = -180.0;
constexpr double kStepEpsilon = 1e-9;
}  // namespace

bool IsValidGridStep(double grid_step) {
  if (!(grid_step > 0.0) || grid_step > kLatExtent) return false;
  const auto rows = kLatExtent / grid_step;
  return std::abs(rows - std::round(rows)) < kStepEpsilon;
}

std::vector<CellBounds> GenerateGrid(double grid_step) {
  ST_ASSERT(IsValidGridStep(grid_step), "Grid step {} doesn't divide 180 degrees evenly.", grid_step);

  const auto rows = static_cast<int64_t>(std::llround(kLatExtent / grid_step));
  const auto columns = 2 * rows;

  std::vector<CellBounds> cells;
  cells.reserve(rows * columns);
  for (int64_t row = 0; row < rows; ++row) {
    const auto lat_min = kLatOrigin + static_cast<double>(row) * grid_step;
    const auto lat_max = kLatOrigin + static_cast<double>(row + 1) * grid_step;
    for (int64_t column = 0; column < columns; ++column) {
      cells.push_back({.lng_min = kLngOrigin + static_cast<double>(column) * grid_step,
                       .lat_min = lat_min,
                       .lng_max = kLngOrigin + static_cast<double>(column + 1) * grid_step,
                       .lat_max = lat_max});
    }
  }
  spdlog::debug("Generated grid of {} x {} cells with step {}", rows, columns, grid_step);
  return cells;
}

}  // namespace stitcher::catalog
