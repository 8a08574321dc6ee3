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

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"

namespace stitcher::kvstore {

class KVStoreError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(KVStoreError)
};

/**
 * Durable ordered key-value table on top of RocksDB. Safe to use from
 * multiple threads.
 */
class KVStore final {
 public:
  using Visitor = std::function<void(std::string_view key, std::string_view value)>;

  /**
   * @param storage Directory holding the data, created if missing.
   * @throw KVStoreError if the directory can't be created or RocksDB refuses
   *        to open it, e.g. because another KVStore holds it.
   */
  explicit KVStore(const std::filesystem::path &storage);

  KVStore(const KVStore &) = delete;
  KVStore(KVStore &&) = delete;
  KVStore &operator=(const KVStore &) = delete;
  KVStore &operator=(KVStore &&) = delete;

  ~KVStore();

  /// @return false if the write failed.
  bool Put(std::string_view key, std::string_view value);

  /// Writes all `items` atomically.
  /// @return false if the write failed, in which case nothing was written.
  bool PutBatch(const std::vector<std::pair<std::string, std::string>> &items);

  /// @return std::nullopt if the key doesn't exist or the read failed.
  std::optional<std::string> Get(std::string_view key) const;

  /// Deleting a missing key succeeds.
  bool Delete(std::string_view key);

  /// Deletes every key starting with `prefix` in a single batch.
  bool DeletePrefix(std::string_view prefix);

  /**
   * Calls `visit` for every key starting with `prefix`, in key order. The
   * scan reads a snapshot taken when it starts: writes made during the scan,
   * also from `visit`, are not observed and are not blocked.
   *
   * @return false if the scan was cut short by a read error.
   */
  bool Scan(std::string_view prefix, const Visitor &visit) const;

 private:
  struct impl;
  std::unique_ptr<impl> pimpl_;
};

}  // namespace stitcher::kvstore
