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

#include "flags/log_level.hpp"

#include <array>
#include <chrono>
#include <iostream>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "gflags/gflags.h"
#include "spdlog/sinks/daily_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

namespace {

using namespace std::string_view_literals;

constexpr std::array kLogLevels{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

// Daily files, five weeks of them.
constexpr uint16_t kLogFilesKept = 35;

const std::string kLogLevelHelp =
    fmt::format("Lowest level that is logged, one of: {}", stitcher::utils::GetAllowedEnumValuesString(kLogLevels));

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "INFO", kLogLevelHelp.c_str(), { return stitcher::flags::ValidLogLevel(value); });
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(log_file, "", "File the log is written to, rotated at midnight. Empty disables file logging.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(also_log_to_stderr, true, "Also write the log to stderr.");

namespace stitcher::flags {

bool ValidLogLevel(std::string_view value) {
  const auto valid = utils::IsValidEnumValueString(value, kLogLevels);
  if (valid) return true;
  if (valid.error() == utils::ValidationError::EmptyValue) {
    std::cout << "--log_level can't be empty." << std::endl;
  } else {
    std::cout << "Unknown --log_level " << value << ", expected one of "
              << utils::GetAllowedEnumValuesString(kLogLevels) << std::endl;
  }
  return false;
}

std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value) {
  return utils::StringToEnum<spdlog::level::level_enum>(value, kLogLevels);
}

void InitializeLogger() {
  const auto level = LogLevelToEnum(FLAGS_log_level);
  ST_ASSERT(level, "--log_level {} passed validation but has no level.", FLAGS_log_level);

  std::vector<spdlog::sink_ptr> sinks;
  if (FLAGS_also_log_to_stderr) {
    sinks.emplace_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  if (!FLAGS_log_file.empty()) {
    sinks.emplace_back(
        std::make_shared<spdlog::sinks::daily_file_sink_mt>(FLAGS_log_file, 0, 0, false, kLogFilesKept));
  }

  auto logger = std::make_shared<spdlog::logger>("stitcher", sinks.begin(), sinks.end());
  logger->set_level(*level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_every(std::chrono::seconds(1));
}

}  // namespace stitcher::flags
