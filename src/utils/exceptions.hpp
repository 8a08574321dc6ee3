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

#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace stitcher::utils {

#define SPECIALIZE_GET_EXCEPTION_NAME(exep) \
  std::string name() const override { return #exep; }

/// Base of the exceptions thrown for failures the caller can't retry, like
/// an unusable data directory or listen address. `name()` identifies the
/// subclass in logs.
class BasicException : public std::exception {
 public:
  explicit BasicException(const char *message) noexcept : msg_(message) {}
  explicit BasicException(std::string message) noexcept : msg_(std::move(message)) {}

  template <class... Args>
  explicit BasicException(fmt::format_string<Args...> fmt, Args &&...args) noexcept
      : msg_(fmt::format(fmt, std::forward<Args>(args)...)) {}

  const char *what() const noexcept override { return msg_.c_str(); }

  virtual std::string name() const { return "BasicException"; }

 protected:
  std::string msg_;
};

}  // namespace stitcher::utils
