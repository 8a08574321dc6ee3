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

/** @file */
#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stitcher::utils {

/** Remove whitespace characters from the start and from the end of a string. */
inline std::string_view Trim(const std::string_view s) {
  size_t start = 0;
  size_t count = s.size();
  while (start < s.size() && isspace(s[start])) {
    ++start;
  }
  while (count > start && isspace(s[count - 1])) {
    --count;
  }
  return std::string_view(s.data() + start, count - start);
}

/**
 * Split a string by `delimiter` with a maximum of `splits` into a vector.
 * The vector will have at most `splits` + 1 elements. Negative value of
 * `splits` indicates to perform all possible splits.
 * @return pointer to `out`.
 */
template <class TString, class TAllocator>
std::vector<TString, TAllocator> *Split(std::vector<TString, TAllocator> *out, const std::string_view src,
                                        const std::string_view delimiter, int splits = -1) {
  out->clear();
  if (src.empty()) return out;
  size_t index = 0;
  while (splits < 0 || splits-- != 0) {
    auto n = src.find(delimiter, index);
    if (n == std::string::npos) break;
    out->emplace_back(src.substr(index, n - index));
    index = n + delimiter.size();
  }
  out->emplace_back(src.substr(index));
  return out;
}

/**
 * Split a string by `delimiter` with a maximum of `splits` into a vector.
 * The vector will have at most `splits` + 1 elements. Negative value of
 * `splits` indicates to perform all possible splits.
 */
inline std::vector<std::string> Split(const std::string_view src, const std::string_view delimiter, int splits = -1) {
  std::vector<std::string> res;
  Split(&res, src, delimiter, splits);
  return res;
}

/**
 * Split `src` by `delimiter`, trim every element and drop the empty ones.
 * "a, b,,c " becomes {"a", "b", "c"}.
 */
inline std::vector<std::string> SplitList(const std::string_view src, const std::string_view delimiter = ",") {
  std::vector<std::string> res;
  for (const auto &item : Split(src, delimiter)) {
    auto trimmed = Trim(item);
    if (!trimmed.empty()) res.emplace_back(trimmed);
  }
  return res;
}

/**
 * Join the `strings` collection separated by a given separator.
 */
inline std::string Join(const std::vector<std::string> &strings, const std::string_view separator) {
  std::string res;
  if (strings.empty()) return res;
  res += strings[0];
  for (auto it = strings.begin() + 1; it != strings.end(); ++it) {
    res += separator;
    res += *it;
  }
  return res;
}

}  // namespace stitcher::utils
