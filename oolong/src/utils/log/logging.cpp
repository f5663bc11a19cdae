//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "utils/log/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

#include "utils/string/convert.hpp"

namespace oolong {
namespace {
constexpr const char* kLoggerName = "oolong";
constexpr const char* kPattern    = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}  // namespace

auto ParseLogLevel(std::string_view name) -> spdlog::level::level_enum {
  auto lower = conv::ToLower(conv::Trim(name));
  if (lower == "trace") return spdlog::level::trace;
  if (lower == "debug") return spdlog::level::debug;
  if (lower == "info") return spdlog::level::info;
  if (lower == "warn" || lower == "warning") return spdlog::level::warn;
  if (lower == "error") return spdlog::level::err;
  if (lower == "critical") return spdlog::level::critical;
  if (lower == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void InitLogging(spdlog::level::level_enum level) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern(kPattern);
    spdlog::set_default_logger(logger);
  }
  logger->set_level(level);
}
};  // namespace oolong
