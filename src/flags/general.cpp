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

#include "flags/general.hpp"

#include <limits>

#include "utils/flag_validation.hpp"

// Short help flag.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(h, false, "Print usage and exit.");

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(app_address, "0.0.0.0", "IP address on which the coordinator HTTP server should listen.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int32(app_port, 8080, "Port on which the coordinator HTTP server should listen.",
                       FLAG_IN_RANGE(0, std::numeric_limits<uint16_t>::max()));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(external_address, "localhost",
              "Address under which workers can reach this coordinator. Used to build the callback URL.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int32(external_port, 0,
                       "Port under which workers can reach this coordinator. 0 means the same as --app_port.",
                       FLAG_IN_RANGE(0, std::numeric_limits<uint16_t>::max()));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_int32(http_threads, 2, "Number of threads serving the coordinator HTTP server.",
                       FLAG_IN_RANGE(1, 64));

// General purpose flags.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(data_directory, "nci_stitcher_workspace",
              "Path to directory in which to save all permanent data (the work catalog).");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(reinitialize_catalog, false,
            "Drop the existing work catalog and recreate it. Otherwise an existing catalog is resumed.");

int stitcher::flags::ExternalPort() { return FLAGS_external_port != 0 ? FLAGS_external_port : FLAGS_app_port; }
