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

#include "flags/coordination.hpp"

#include <limits>

#include "catalog/grid.hpp"
#include "utils/flag_validation.hpp"
#include "utils/string.hpp"

// Fleet discovery.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(worker_list, "",
              "Comma separated list of host:port workers. When set, EC2 discovery is skipped and the registry is "
              "reconciled once against this list.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int32(worker_port, 8888, "Port on which discovered workers serve the stitch API.",
                       FLAG_IN_RANGE(1, std::numeric_limits<uint16_t>::max()));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(worker_tag, "ndr-nci-stitcher-worker", "EC2 tag value identifying worker instances.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(aws_region, "", "AWS region used for EC2 discovery. Empty means the SDK default.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(discovery_interval_sec, 30, "Interval (in seconds) between two fleet discovery cycles.",
                        FLAG_IN_RANGE(1, 24UL * 3600));

// Work catalog.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_double(grid_step, 2.0, "Size of a grid cell in degrees. Must divide 180 evenly.", {
  if (stitcher::catalog::IsValidGridStep(value)) return true;
  std::cout << "Expected --" << flagname << " to be positive and to divide 180 evenly" << std::endl;
  return false;
});
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(scenario_list,
              "baseline_potter,baseline_napp_rate,ag_expansion,ag_intensification,restoration_potter,"
              "restoration_napp_rate",
              "Comma separated list of scenarios to stitch.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(raster_list, "n_export,modified_load", "Comma separated list of raster kinds to stitch.");

// Dispatch.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(bucket_uri_prefix, "s3://nci-ecoshards/ndr_scenarios",
              "URI prefix under which workers store stitched results.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_double(wgs84_pixel_size, 0.002, "Output pixel size in WGS84 degrees.", {
  if (value > 0.0) return true;
  std::cout << "Expected --" << flagname << " to be positive" << std::endl;
  return false;
});
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_uint64(result_queue_size, 10000,
              "Completion results kept for downstream consumers. Results beyond it are dropped, 0 keeps all.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int32(dispatch_timeout_sec, 60, "Timeout (in seconds) of a single stitch request to a worker.",
                       FLAG_IN_RANGE(1, 3600));

namespace stitcher::flags {

auto ParseWorkerList() -> std::vector<std::string> { return utils::SplitList(FLAGS_worker_list); }

auto ParseScenarioList() -> std::vector<std::string> { return utils::SplitList(FLAGS_scenario_list); }

auto ParseRasterList() -> std::vector<std::string> { return utils::SplitList(FLAGS_raster_list); }

}  // namespace stitcher::flags
