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

#include <string>

#include <nlohmann/json.hpp>

#include "catalog/grid.hpp"

namespace stitcher::catalog {

/// Job description sent to a worker. Identifies exactly one WorkItem.
struct JobPayload {
  std::string scenario_id;
  std::string raster_id;
  CellBounds bounds;

  bool operator==(const JobPayload &) const = default;
};

struct WorkItem {
  JobPayload payload;
  bool stitched{false};
};

/// Flat representation: {scenario_id, raster_id, lng_min, lat_min, lng_max, lat_max}.
void to_json(nlohmann::json &data, const JobPayload &payload);
/// @throw nlohmann::json::exception if a field is missing or has the wrong type.
void from_json(const nlohmann::json &data, JobPayload &payload);

/// Payload fields plus `stitched` as 0 or 1.
void to_json(nlohmann::json &data, const WorkItem &item);
void from_json(const nlohmann::json &data, WorkItem &item);

}  // namespace stitcher::catalog
