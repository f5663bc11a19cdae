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

#include <cstddef>

#include "type/hash_type.hpp"
#include "type/stage_result.hpp"
#include "type/type.hpp"

namespace oolong {
class ContentHasher {
 public:
  static constexpr size_t kChunkSize = 4096;

  /**
   * @brief Digest the content of a file, reading it in fixed-size chunks.
   *
   * @param file
   * @return StageResult<Hash128> HASH_ERROR when the file cannot be read
   */
  static auto HashFile(const file_path_t& file) -> StageResult<Hash128>;
};
};  // namespace oolong
