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

#include "type/type.hpp"

namespace oolong {
/**
 * @brief A logical photo, identified by the digest of its content when one is known.
 *        id_ is 0 until the record is persisted.
 */
struct Photograph {
  photograph_id_t                                      id_ = 0;
  std::optional<std::string>                           content_hash_{};
  // Path relative to the media root
  std::optional<std::string>                           stored_image_{};
  std::optional<std::chrono::system_clock::time_point> capture_time_{};
  std::optional<std::string>                           camera_model_{};
  bool                                                 has_errors_ = false;
  std::chrono::system_clock::time_point                created_at_{};
  std::chrono::system_clock::time_point                updated_at_{};

  auto IsPersisted() const -> bool { return id_ != 0; }
};
};  // namespace oolong
