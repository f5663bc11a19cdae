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

#include "io/file/file_scanner.hpp"

#include <spdlog/spdlog.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include "device/device_resolver.hpp"
#include "type/supported_file_type.hpp"

namespace oolong {
namespace {
auto FromTimespec(const timespec& ts) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
}
}  // namespace

auto FileScanner::ReadAttributes(const file_path_t& file) -> StageResult<FileAttributes> {
  struct stat st {};
  if (::stat(file.c_str(), &st) != 0) {
    return StageResult<FileAttributes>::Fail(
        ErrorCode::IO_ERROR, "Cannot stat '" + file.string() + "': " + std::strerror(errno));
  }
  FileAttributes attrs;
  attrs.size_        = static_cast<int64_t>(st.st_size);
  attrs.created_at_  = FromTimespec(st.st_ctim);
  attrs.modified_at_ = FromTimespec(st.st_mtim);
  return StageResult<FileAttributes>::Ok(attrs);
}

auto FileScanner::IsWithin(const file_path_t& path, const file_path_t& dir) -> bool {
  auto p_it = path.begin();
  for (auto d_it = dir.begin(); d_it != dir.end(); ++d_it) {
    // A trailing separator shows up as an empty last element
    if (d_it->empty() && std::next(d_it) == dir.end()) break;
    if (p_it == path.end() || *p_it != *d_it) return false;
    ++p_it;
  }
  return true;
}

auto FileScanner::Scan(const file_path_t& root, bool recursive,
                       const std::optional<file_path_t>& excluded_dir)
    -> std::vector<file_path_t> {
  std::error_code ec;
  std::optional<file_path_t> excluded;
  if (excluded_dir.has_value() && !excluded_dir->empty()) {
    excluded = DeviceResolver::CanonicalizeLenient(*excluded_dir);
  }
  auto is_excluded = [&](const file_path_t& p) {
    if (!excluded.has_value()) return false;
    return IsWithin(DeviceResolver::CanonicalizeLenient(p), *excluded);
  };

  std::vector<file_path_t> found;
  if (std::filesystem::is_regular_file(root, ec)) {
    if (is_supported_extension(root) && !is_excluded(root)) {
      found.push_back(root);
    }
    return found;
  }
  if (!std::filesystem::is_directory(root, ec)) {
    throw std::invalid_argument("Path does not exist or is not a file/directory: " +
                                root.string());
  }
  if (is_excluded(root)) {
    spdlog::warn("'{}' lies inside the managed storage and is not scanned", root.string());
    return found;
  }

  const auto options = std::filesystem::directory_options::skip_permission_denied;
  if (recursive) {
    std::filesystem::recursive_directory_iterator it(root, options, ec);
    if (ec) {
      throw std::runtime_error("Cannot read directory '" + root.string() + "': " + ec.message());
    }
    for (const std::filesystem::recursive_directory_iterator end{}; it != end;) {
      const auto& entry = *it;
      if (entry.is_directory(ec)) {
        if (is_excluded(entry.path())) {
          spdlog::debug("Pruned managed storage '{}'", entry.path().string());
          it.disable_recursion_pending();
        }
      } else if (entry.is_regular_file(ec) && is_supported_extension(entry.path()) &&
                 !is_excluded(entry.path())) {
        found.push_back(entry.path());
      }
      it.increment(ec);
      if (ec) {
        spdlog::warn("Stopped walking '{}': {}", root.string(), ec.message());
        break;
      }
    }
  } else {
    std::filesystem::directory_iterator it(root, options, ec);
    if (ec) {
      throw std::runtime_error("Cannot read directory '" + root.string() + "': " + ec.message());
    }
    for (const std::filesystem::directory_iterator end{}; it != end;) {
      const auto& entry = *it;
      if (entry.is_regular_file(ec) && is_supported_extension(entry.path()) &&
          !is_excluded(entry.path())) {
        found.push_back(entry.path());
      }
      it.increment(ec);
      if (ec) {
        spdlog::warn("Stopped listing '{}': {}", root.string(), ec.message());
        break;
      }
    }
  }

  std::sort(found.begin(), found.end());
  spdlog::debug("Scanner collected {} file(s) under '{}'", found.size(), root.string());
  return found;
}
};  // namespace oolong
