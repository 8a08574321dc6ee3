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

#include "catalog/work_item.hpp"

namespace stitcher::catalog {

void to_json(nlohmann::json &data, const JobPayload &payload) {
  data = nlohmann::json{{"scenario_id", payload.scenario_id},  {"raster_id", payload.raster_id},
                        {"lng_min", payload.bounds.lng_min},   {"lat_min", payload.bounds.lat_min},
                        {"lng_max", payload.bounds.lng_max},   {"lat_max", payload.bounds.lat_max}};
}

void from_json(const nlohmann::json &data, JobPayload &payload) {
  data.at("scenario_id").get_to(payload.scenario_id);
  data.at("raster_id").get_to(payload.raster_id);
  data.at("lng_min").get_to(payload.bounds.lng_min);
  data.at("lat_min").get_to(payload.bounds.lat_min);
  data.at("lng_max").get_to(payload.bounds.lng_max);
  data.at("lat_max").get_to(payload.bounds.lat_max);
}

void to_json(nlohmann::json &data, const WorkItem &item) {
  to_json(data, item.payload);
  data["stitched"] = item.stitched ? 1 : 0;
}

void from_json(const nlohmann::json &data, WorkItem &item) {
  from_json(data, item.payload);
  item.stitched = data.at("stitched").get<int>() != 0;
}

}  // namespace stitcher::catalog
