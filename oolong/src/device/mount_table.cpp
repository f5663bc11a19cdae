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

#include "device/mount_table.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace oolong {
namespace {
auto IsOctalDigit(char c) -> bool { return c >= '0' && c <= '7'; }

auto StripTrailingSlash(std::string value) -> std::string {
  while (value.size() > 1 && value.back() == '/') {
    value.pop_back();
  }
  return value;
}
}  // namespace

auto MountTable::UnescapeOctal(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 3 < value.size() && IsOctalDigit(value[i + 1]) &&
        IsOctalDigit(value[i + 2]) && IsOctalDigit(value[i + 3])) {
      int code = (value[i + 1] - '0') * 64 + (value[i + 2] - '0') * 8 + (value[i + 3] - '0');
      out.push_back(static_cast<char>(code & 0xFF));
      i += 3;
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

auto MountTable::Parse(std::istream& in) -> std::vector<MountEntry> {
  std::vector<MountEntry> entries;
  std::string             line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    std::istringstream fields(line);
    std::string        device, mount_point, fs_type;
    if (!(fields >> device >> mount_point >> fs_type)) {
      continue;
    }
    entries.push_back({UnescapeOctal(device), StripTrailingSlash(UnescapeOctal(mount_point)),
                       fs_type});
  }
  return entries;
}

auto MountTable::Load(const file_path_t& table_path) -> StageResult<std::vector<MountEntry>> {
  std::ifstream in(table_path);
  if (!in.is_open()) {
    return StageResult<std::vector<MountEntry>>::Fail(
        ErrorCode::MOUNT_RESOLUTION_ERROR,
        std::format("Mount table '{}' is not readable", table_path.string()));
  }
  return StageResult<std::vector<MountEntry>>::Ok(Parse(in));
}

auto MountTable::FindBestMount(const std::vector<MountEntry>& entries,
                               const std::string& canonical_path) -> std::optional<MountEntry> {
  std::optional<MountEntry> best;
  for (const auto& entry : entries) {
    const std::string& mp = entry.mount_point_;
    if (mp.empty() || mp[0] != '/') {
      continue;
    }
    bool owns = false;
    if (mp == "/") {
      owns = !canonical_path.empty() && canonical_path[0] == '/';
    } else if (canonical_path.compare(0, mp.size(), mp) == 0) {
      owns = canonical_path.size() == mp.size() || canonical_path[mp.size()] == '/';
    }
    // Later entries win ties, they shadow earlier mounts on the same point
    if (owns && (!best || mp.size() >= best->mount_point_.size())) {
      best = entry;
    }
  }
  return best;
}
};  // namespace oolong
