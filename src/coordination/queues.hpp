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

#include <nlohmann/json.hpp>

#include "catalog/work_item.hpp"
#include "utils/data_queue.hpp"

namespace stitcher::coordination {

/// Payloads recovered from dead workers, waiting for redelivery by the Dispatcher.
using RescheduleQueue = utils::DataQueue<catalog::JobPayload>;

/// Completion bodies handed to downstream consumers.
using ResultQueue = utils::DataQueue<nlohmann::json>;

}  // namespace stitcher::coordination
