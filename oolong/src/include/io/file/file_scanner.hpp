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
#include <vector>

#include "type/stage_result.hpp"
#include "type/type.hpp"

namespace oolong {
struct FileAttributes {
  int64_t                               size_ = 0;
  // Inode change time, the closest POSIX offers to a creation time
  std::chrono::system_clock::time_point created_at_{};
  std::chrono::system_clock::time_point modified_at_{};
};

class FileScanner {
 public:
  /**
   * @brief Collect the recognized image files under a root. A root that is a file yields
   *        itself when its extension is recognized. Any directory that resolves to the
   *        excluded directory (or below it) is pruned without being entered.
   *
   * @param root
   * @param recursive
   * @param excluded_dir managed storage of the catalog, never scanned
   * @return std::vector<file_path_t> sorted paths
   * @throw std::invalid_argument when root is neither a file nor a directory
   */
  static auto Scan(const file_path_t& root, bool recursive,
                   const std::optional<file_path_t>& excluded_dir = std::nullopt)
      -> std::vector<file_path_t>;

  static auto ReadAttributes(const file_path_t& file) -> StageResult<FileAttributes>;

  // Both paths canonical, component-wise prefix test
  static auto IsWithin(const file_path_t& path, const file_path_t& dir) -> bool;
};
};  // namespace oolong
