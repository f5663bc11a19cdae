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

#include "config/app_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace oolong {
namespace {
auto ReadString(const nlohmann::json& doc, const char* key) -> std::optional<std::string> {
  if (!doc.contains(key) || doc[key].is_null()) return std::nullopt;
  if (!doc[key].is_string()) {
    throw std::invalid_argument(std::string("Configuration key '") + key + "' must be a string");
  }
  return doc[key].get<std::string>();
}
}  // namespace

auto AppConfig::FromJson(const nlohmann::json& doc) -> AppConfig {
  if (!doc.is_object()) {
    throw std::invalid_argument("Configuration must be a JSON object");
  }
  AppConfig config;
  if (auto value = ReadString(doc, "catalog_path")) config.catalog_path_ = *value;
  if (auto value = ReadString(doc, "media_root")) config.media_root_ = *value;
  if (auto value = ReadString(doc, "log_level")) config.log_level_ = *value;
  if (auto value = ReadString(doc, "output_format")) {
    auto fmt = ParseImageFormat(*value);
    if (!fmt.has_value()) {
      throw std::invalid_argument("Unsupported output_format '" + *value +
                                  "', expected JPEG or PNG");
    }
    config.output_format_ = *fmt;
  }
  return config;
}

auto AppConfig::ToJson() const -> nlohmann::json {
  nlohmann::json doc;
  doc["catalog_path"]  = catalog_path_.string();
  doc["media_root"]    = media_root_.string();
  doc["log_level"]     = log_level_;
  doc["output_format"] = ImageFormatName(output_format_);
  return doc;
}

auto AppConfig::Load(const file_path_t& config_path) -> AppConfig {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file '" + config_path.string() +
                             "' for reading");
  }
  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Malformed config file '" + config_path.string() + "': " +
                             e.what());
  }
  return FromJson(doc);
}

void AppConfig::Save(const file_path_t& config_path) const {
  if (config_path.has_parent_path()) {
    std::filesystem::create_directories(config_path.parent_path());
  }
  std::ofstream file(config_path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config file '" + config_path.string() +
                             "' for writing");
  }
  file << ToJson().dump(4);
  file.close();
}

auto AppConfig::ResolveConfigPath(const std::optional<file_path_t>& explicit_path)
    -> std::optional<file_path_t> {
  if (explicit_path.has_value() && !explicit_path->empty()) {
    return explicit_path;
  }
  if (const char* env = std::getenv(kEnvVariable); env != nullptr && *env != '\0') {
    return file_path_t(env);
  }
  std::error_code ec;
  if (std::filesystem::is_regular_file(kDefaultFileName, ec)) {
    return file_path_t(kDefaultFileName);
  }
  return std::nullopt;
}

auto AppConfig::LoadResolved(const std::optional<file_path_t>& explicit_path) -> AppConfig {
  auto path = ResolveConfigPath(explicit_path);
  if (!path.has_value()) {
    return AppConfig{};
  }
  spdlog::debug("Loading configuration from '{}'", path->string());
  return Load(*path);
}
};  // namespace oolong
