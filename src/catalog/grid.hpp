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

#include <vector>

namespace stitcher::catalog {

/// Axis aligned WGS84 box, in degrees. Min edges are inclusive, max edges are
/// exclusive.
struct CellBounds {
  double lng_min;
  double lat_min;
  double lng_max;
  double lat_max;

  bool operator==(const CellBounds &) const = default;
};

/// True if `grid_step` is positive and tiles 180 degrees a whole number of
/// times.
bool IsValidGridStep(double grid_step);

/**
 * Tiles latitude [-90, 90) and longitude [-180, 180) into square cells of
 * `grid_step` degrees. Rows are ordered from south to north and, within a
 * row, cells from west to east. Edges are computed from integer cell indices
 * so neighbouring cells share their edges exactly.
 *
 * The result has (180 / grid_step) * (360 / grid_step) cells.
 */
std::vector<CellBounds> GenerateGrid(double grid_step);

}  // namespace stitcher::catalog
