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
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "utils/enum.hpp"
#include "utils/flag_validation.hpp"
#include "utils/logging.hpp"

using namespace std::string_view_literals;

namespace {

inline constexpr std::array kLogLevelMappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

const std::string kLogLevelHelpString = fmt::format("Minimum log level. Allowed values: {}",
                                                    graphbin::utils::GetAllowedEnumValuesString(kLogLevelMappings));

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(log_level, "WARNING", kLogLevelHelpString.c_str(),
                        { return graphbin::flags::ValidLogLevel(value); });

bool graphbin::flags::ValidLogLevel(std::string_view value) {
  if (value.empty()) {
    std::cout << "Log level cannot be empty." << std::endl;
    return false;
  }
  if (!utils::IsValidEnumValueString(value, kLogLevelMappings)) {
    std::cout << "Invalid value for log level. Allowed values: "
              << utils::GetAllowedEnumValuesString(kLogLevelMappings) << std::endl;
    return false;
  }
  return true;
}

std::optional<spdlog::level::level_enum> graphbin::flags::LogLevelToEnum(std::string_view value) {
  return utils::StringToEnum<spdlog::level::level_enum>(value, kLogLevelMappings);
}

void graphbin::flags::InitializeLogger() {
  const auto log_level = LogLevelToEnum(FLAGS_log_level);
  GB_ASSERT(log_level, "Invalid log level {}", FLAGS_log_level);

  auto logger = std::make_shared<spdlog::logger>("graphbin_log", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  logger->set_level(*log_level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));
}
