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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "io/image/transcoder.hpp"
#include "type/type.hpp"

namespace oolong {
struct AppConfig {
  file_path_t     catalog_path_  = "oolong_catalog.duckdb";
  // Managed storage, excluded from discovery
  file_path_t     media_root_    = "oolong_media";
  std::string     log_level_     = "info";
  ImageFormatType output_format_ = ImageFormatType::JPEG;

  /**
   * @brief Read the known keys, missing keys keep their defaults.
   *
   * @param doc
   * @return AppConfig
   * @throw std::invalid_argument on a value of the wrong type or an unknown output format
   */
  static auto FromJson(const nlohmann::json& doc) -> AppConfig;
  auto        ToJson() const -> nlohmann::json;

  static auto Load(const file_path_t& config_path) -> AppConfig;
  void        Save(const file_path_t& config_path) const;

  /**
   * @brief Pick the configuration file: the explicit path, then $OOLONG_CONFIG, then
   *        ./oolong.json when it exists.
   *
   * @param explicit_path
   * @return std::optional<file_path_t> nullopt when defaults apply
   */
  static auto ResolveConfigPath(const std::optional<file_path_t>& explicit_path)
      -> std::optional<file_path_t>;

  static auto LoadResolved(const std::optional<file_path_t>& explicit_path) -> AppConfig;

  static constexpr const char* kEnvVariable    = "OOLONG_CONFIG";
  static constexpr const char* kDefaultFileName = "oolong.json";
};
};  // namespace oolong
