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

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace oolong {
struct Resolution {
  uint32_t width_  = 0;
  uint32_t height_ = 0;

  auto     operator==(const Resolution& other) const -> bool = default;
  auto     ToString() const -> std::string;
};

class ResolutionResolver {
 public:
  /**
   * @brief Parse a target size, either "WIDTHxHEIGHT" or a preset name. Case-insensitive.
   *
   * @param value
   * @return std::optional<Resolution> nullopt for anything unrecognized
   */
  static auto Parse(std::string_view value) -> std::optional<Resolution>;

  static auto Presets() -> const std::map<std::string, Resolution>&;

  // Presets ordered by pixel count, then by name
  static auto SortedPresets() -> std::vector<std::pair<std::string, Resolution>>;
};
};  // namespace oolong
