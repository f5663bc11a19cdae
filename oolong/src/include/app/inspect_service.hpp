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

#include <memory>
#include <nlohmann/json.hpp>

#include "decoders/backend_registry.hpp"
#include "type/type.hpp"

namespace oolong {
class InspectService {
 public:
  explicit InspectService(std::shared_ptr<BackendRegistry> backends);

  /**
   * @brief Describe a single file as JSON with the sections "file", "image", "exif" and
   *        "raw". Sections that cannot be read stay empty objects.
   *
   * @param path
   * @return nlohmann::json
   * @throw std::invalid_argument when the file does not exist
   */
  auto InspectFile(const image_path_t& path) -> nlohmann::json;

 private:
  auto DescribeImage(const image_path_t& path) -> nlohmann::json;

  std::shared_ptr<BackendRegistry> backends_;
};
};  // namespace oolong
