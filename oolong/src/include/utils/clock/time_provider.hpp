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

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace oolong {
class TimeProvider {
 public:
  static auto Now() -> std::chrono::system_clock::time_point;

  /**
   * @brief UTC "YYYY-MM-DD HH:MM:SS.ffffff", the form DuckDB accepts for TIMESTAMP columns
   *
   * @param tp
   * @return std::string
   */
  static auto ToSqlTimestamp(const std::chrono::system_clock::time_point& tp) -> std::string;

  // Accepts "YYYY-MM-DD HH:MM:SS" with an optional fraction of up to 9 digits
  static auto FromSqlTimestamp(std::string_view value)
      -> std::optional<std::chrono::system_clock::time_point>;

  // UTC "YYYYmmdd_HHMMSS_ffffff", used to name generated files
  static auto ToFileStamp(const std::chrono::system_clock::time_point& tp) -> std::string;
};
}  // namespace oolong
