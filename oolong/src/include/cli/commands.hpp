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

#include <optional>
#include <ostream>
#include <string>

#include "config/app_config.hpp"

namespace oolong {
struct IngestArgs {
  std::string                path_;
  std::optional<std::string> resolution_{};
  bool                       hash_         = false;
  bool                       no_recursive_ = false;
  bool                       store_images_ = false;
  std::optional<std::string> device_{};
};

struct ConvertArgs {
  std::string                source_;
  std::optional<std::string> output_{};
  std::optional<std::string> resolution_{};
  std::string                format_ = "JPEG";
};

struct InfoArgs {
  std::string file_;
  bool        json_ = false;
};

// Each command returns the process exit code
auto RunIngest(const AppConfig& config, const IngestArgs& args, std::ostream& out,
               std::ostream& err) -> int;
auto RunConvert(const ConvertArgs& args, std::ostream& out, std::ostream& err) -> int;
auto RunPresets(std::ostream& out) -> int;
auto RunInfo(const InfoArgs& args, std::ostream& out, std::ostream& err) -> int;

// Values longer than 100 characters become their first 97 characters plus "..."
auto TruncateForDisplay(const std::string& value) -> std::string;
};  // namespace oolong
