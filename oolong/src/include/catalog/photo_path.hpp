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
#include <cstdint>
#include <optional>
#include <string>

#include "type/type.hpp"

namespace oolong {
// One physical location of a photograph's source file, unique per (path_, device_)
struct PhotoPath {
  photo_path_id_t                                      id_ = 0;
  std::string                                          path_;
  device_id_t                                          device_;
  int64_t                                              size_ = 0;
  std::optional<std::chrono::system_clock::time_point> file_created_at_{};
  std::optional<std::chrono::system_clock::time_point> file_modified_at_{};
  std::optional<photograph_id_t>                       photograph_id_{};
  std::chrono::system_clock::time_point                created_at_{};
  std::chrono::system_clock::time_point                updated_at_{};
};
};  // namespace oolong
