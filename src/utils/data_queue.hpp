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

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>

#include "utils/logging.hpp"

namespace stitcher::utils {

/// FIFO shared between producer threads and blocking consumers, optionally
/// bounded.
template <typename T>
class DataQueue {
  mutable std::mutex mutex_;
  std::condition_variable_any readerCv_;
  std::condition_variable_any writerCv_;
  std::queue<T> queue_;
  bool done_{false};
  std::size_t maxSize_;

  bool full() const { return maxSize_ != 0 && queue_.size() >= maxSize_; }

 public:
  /**
   * Constructs an empty queue holding at most `maxSize` items.
   * If `maxSize == 0` the queue size is unbounded.
   */
  explicit DataQueue(std::size_t const maxSize = 0) : maxSize_(maxSize) {}

  /**
   * Push an item onto the work queue, blocking while the queue is full.
   * Notify a single thread that work is available. If `finish()` has been
   * called, do nothing and return false. If `push()` returns false, `item`
   * has not been moved from.
   *
   * @param item  Item to push onto the queue.
   * @returns     True upon success, false if `finish()` has been called.
   */
  template <typename U>
  bool push(U &&item) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      writerCv_.wait(lock, [&] { return !full() || done_; });
      if (done_) {
        return false;
      }
      queue_.push(std::forward<U>(item));
    }
    readerCv_.notify_one();
    return true;
  }

  /// Like push(), but returns false instead of blocking when the queue is full.
  template <typename U>
  bool try_push(U &&item) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (done_ || full()) {
        return false;
      }
      queue_.push(std::forward<U>(item));
    }
    readerCv_.notify_one();
    return true;
  }

  /**
   * Pops the oldest item. Blocks until data is available, `finish()` has been
   * called or `token` is stopped.
   *
   * @returns std::nullopt if the queue is empty and either `finish()` has been
   *          called or `token` was stopped.
   */
  std::optional<T> pop(std::stop_token token = {}) {
    std::optional<T> item;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      readerCv_.wait(lock, token, [&]() { return !queue_.empty() || done_; });

      if (queue_.empty()) {
        DST_ASSERT(done_ || token.stop_requested(), "Woke up with an empty queue");
        return std::nullopt;
      }

      item.emplace(std::move(queue_.front()));
      queue_.pop();
    }
    writerCv_.notify_one();
    return item;
  }

  /// Pops the oldest item without blocking.
  std::optional<T> try_pop() {
    std::optional<T> item;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (queue_.empty()) return std::nullopt;
      item.emplace(std::move(queue_.front()));
      queue_.pop();
    }
    writerCv_.notify_one();
    return item;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  /**
   * Promise that `push()` won't be called again, so once the queue is empty
   * there will never any more work.
   */
  void finish() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      done_ = true;
    }
    readerCv_.notify_all();
    writerCv_.notify_all();
  }
};

}  // namespace stitcher::utils
