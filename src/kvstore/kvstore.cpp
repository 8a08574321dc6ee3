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


#include "kvstore/kvstore.hpp"

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include "utils/file.hpp"
#include "utils/logging.hpp"

namespace stitcher::kvstore {

namespace {

rocksdb::Slice ToSlice(std::string_view view) { return {view.data(), view.size()}; }

std::string_view ToView(const rocksdb::Slice &slice) { return {slice.data(), slice.size()}; }

// Releases the snapshot a scan reads from, also when the visitor throws.
class ScopedSnapshot {
 public:
  explicit ScopedSnapshot(rocksdb::DB *db) : db_(db), snapshot_(db->GetSnapshot()) {}
  ScopedSnapshot(const ScopedSnapshot &) = delete;
  ScopedSnapshot &operator=(const ScopedSnapshot &) = delete;
  ScopedSnapshot(ScopedSnapshot &&) = delete;
  ScopedSnapshot &operator=(ScopedSnapshot &&) = delete;
  ~ScopedSnapshot() { db_->ReleaseSnapshot(snapshot_); }

  rocksdb::ReadOptions ReadOptions() const {
    rocksdb::ReadOptions options;
    options.snapshot = snapshot_;
    return options;
  }

 private:
  rocksdb::DB *db_;
  const rocksdb::Snapshot *snapshot_;
};

}  // namespace

struct KVStore::impl {
  std::filesystem::path storage;
  std::unique_ptr<rocksdb::DB> db;
};

KVStore::KVStore(const std::filesystem::path &storage) : pimpl_(std::make_unique<impl>()) {
  pimpl_->storage = storage;
  if (!utils::EnsureDir(storage)) {
    throw KVStoreError("Directory {} for the key-value store couldn't be created.", storage.string());
  }
  rocksdb::Options options;
  options.create_if_missing = true;
  rocksdb::DB *db = nullptr;
  const auto status = rocksdb::DB::Open(options, storage.string(), &db);
  if (!status.ok()) {
    throw KVStoreError("RocksDB couldn't be opened in {}: {}", storage.string(), status.ToString());
  }
  pimpl_->db.reset(db);
}

KVStore::~KVStore() {
  spdlog::debug("Closing key-value store at {}", pimpl_->storage.string());
  if (!pimpl_->db->SyncWAL().ok()) spdlog::error("Key-value store at {} failed to sync.", pimpl_->storage.string());
  if (!pimpl_->db->Close().ok()) spdlog::error("Key-value store at {} failed to close.", pimpl_->storage.string());
}

bool KVStore::Put(std::string_view key, std::string_view value) {
  return logging::CheckRocksDBStatus(pimpl_->db->Put(rocksdb::WriteOptions{}, ToSlice(key), ToSlice(value)));
}

bool KVStore::PutBatch(const std::vector<std::pair<std::string, std::string>> &items) {
  rocksdb::WriteBatch batch;
  for (const auto &[key, value] : items) {
    if (!logging::CheckRocksDBStatus(batch.Put(key, value))) return false;
  }
  return logging::CheckRocksDBStatus(pimpl_->db->Write(rocksdb::WriteOptions{}, &batch));
}

std::optional<std::string> KVStore::Get(std::string_view key) const {
  std::string value;
  const auto status = pimpl_->db->Get(rocksdb::ReadOptions{}, ToSlice(key), &value);
  if (status.IsNotFound()) return std::nullopt;
  if (!logging::CheckRocksDBStatus(status)) return std::nullopt;
  return value;
}

bool KVStore::Delete(std::string_view key) {
  return logging::CheckRocksDBStatus(pimpl_->db->Delete(rocksdb::WriteOptions{}, ToSlice(key)));
}

bool KVStore::DeletePrefix(std::string_view prefix) {
  rocksdb::WriteBatch batch;
  bool batch_ok = true;
  const bool scan_ok = Scan(prefix, [&](std::string_view key, std::string_view /*value*/) {
    batch_ok = batch_ok && logging::CheckRocksDBStatus(batch.Delete(ToSlice(key)));
  });
  if (!scan_ok || !batch_ok) return false;
  return logging::CheckRocksDBStatus(pimpl_->db->Write(rocksdb::WriteOptions{}, &batch));
}

bool KVStore::Scan(std::string_view prefix, const Visitor &visit) const {
  const ScopedSnapshot snapshot(pimpl_->db.get());
  const std::unique_ptr<rocksdb::Iterator> it(pimpl_->db->NewIterator(snapshot.ReadOptions()));
  for (it->Seek(ToSlice(prefix)); it->Valid(); it->Next()) {
    const auto key = ToView(it->key());
    if (!key.starts_with(prefix)) break;
    visit(key, ToView(it->value()));
  }
  return logging::CheckRocksDBStatus(it->status());
}

}  // namespace stitcher::kvstore
