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

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "type/stage_result.hpp"
#include "type/type.hpp"

namespace oolong {
struct MountEntry {
  std::string device_;
  std::string mount_point_;
  std::string fs_type_;
};

class MountTable {
 public:
  /**
   * @brief Parse an fstab-style mount table (/proc/mounts format). Malformed lines are
   *        skipped. Octal escapes in the device and mount point columns are decoded.
   *
   * @param in
   * @return std::vector<MountEntry>
   */
  static auto Parse(std::istream& in) -> std::vector<MountEntry>;

  static auto Load(const file_path_t& table_path) -> StageResult<std::vector<MountEntry>>;

  // Decode "\NNN" octal sequences, e.g. "\040" -> ' '
  static auto UnescapeOctal(std::string_view value) -> std::string;

  /**
   * @brief Longest-prefix match of a canonical absolute path against the mount points.
   *        Matching respects path component boundaries, "/mnt/data" does not own
   *        "/mnt/database".
   *
   * @param entries
   * @param canonical_path
   * @return std::optional<MountEntry>
   */
  static auto FindBestMount(const std::vector<MountEntry>& entries,
                            const std::string&             canonical_path)
      -> std::optional<MountEntry>;
};
};  // namespace oolong
