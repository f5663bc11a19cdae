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
#include <span>
#include <string>

#include "type/stage_result.hpp"
#include "type/type.hpp"

namespace oolong {
/**
 * @brief Managed storage of the catalog. Stored bitmaps live in
 *        <root>/photographs/<YYYYmmdd_HHMMSS_ffffff><ext> and are referenced by their path
 *        relative to the root.
 */
class MediaStore {
 public:
  explicit MediaStore(file_path_t root);

  auto Root() const -> const file_path_t& { return root_; }
  auto PhotographDir() const -> file_path_t { return root_ / kPhotographDir; }

  /**
   * @brief Write encoded bytes under a fresh timestamp name.
   *
   * @param bytes
   * @param extension with the leading dot, e.g. ".jpg"
   * @return StageResult<std::string> the reference relative to the root, IO_ERROR when the
   *         file cannot be written
   */
  auto Store(std::span<const uint8_t> bytes, const std::string& extension)
      -> StageResult<std::string>;

  // Byte copy of a source file, keeping its extension
  auto StoreCopy(const file_path_t& source) -> StageResult<std::string>;

  auto Resolve(const std::string& reference) const -> file_path_t;

  // Delete a stored file again, false when nothing was removed
  auto Remove(const std::string& reference) -> bool;

  static constexpr const char* kPhotographDir = "photographs";

 private:
  auto NextFreeName(const std::string& extension) const -> file_path_t;

  file_path_t root_;
};
};  // namespace oolong
