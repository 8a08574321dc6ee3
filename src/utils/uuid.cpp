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

#include "utils/uuid.hpp"

#include <uuid/uuid.h>

#include <array>

namespace stitcher::utils {

std::string GenerateUUID() {
  uuid_t uuid;
  constexpr size_t kUuidStringLength = 36;          // UUID format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
  std::array<char, kUuidStringLength + 1> decoded;  // +1 for null terminator written by uuid_unparse
  uuid_generate(uuid);
  uuid_unparse(uuid, decoded.data());
  return {decoded.data(), kUuidStringLength};
}

}  // namespace stitcher::utils
