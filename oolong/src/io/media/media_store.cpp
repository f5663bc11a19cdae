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

#include "io/media/media_store.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

#include "type/supported_file_type.hpp"
#include "utils/clock/time_provider.hpp"

namespace oolong {
MediaStore::MediaStore(file_path_t root) : root_(std::move(root)) {}

auto MediaStore::NextFreeName(const std::string& extension) const -> file_path_t {
  const auto  dir  = PhotographDir();
  std::string stem = TimeProvider::ToFileStamp(TimeProvider::Now());
  auto        candidate = dir / (stem + extension);
  std::error_code ec;
  for (int suffix = 1; std::filesystem::exists(candidate, ec); ++suffix) {
    candidate = dir / (stem + "_" + std::to_string(suffix) + extension);
  }
  return candidate;
}

auto MediaStore::Store(std::span<const uint8_t> bytes, const std::string& extension)
    -> StageResult<std::string> {
  std::error_code ec;
  std::filesystem::create_directories(PhotographDir(), ec);
  if (ec) {
    return StageResult<std::string>::Fail(
        ErrorCode::IO_ERROR, "Cannot create media directory '" + PhotographDir().string() +
                                 "': " + ec.message());
  }

  auto          target = NextFreeName(extension);
  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    return StageResult<std::string>::Fail(ErrorCode::IO_ERROR,
                                          "Cannot open '" + target.string() + "' for writing");
  }
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    std::filesystem::remove(target, ec);
    return StageResult<std::string>::Fail(ErrorCode::IO_ERROR,
                                          "Failed to write '" + target.string() + "'");
  }

  auto reference = std::filesystem::relative(target, root_, ec);
  if (ec || reference.empty()) {
    reference = file_path_t(kPhotographDir) / target.filename();
  }
  spdlog::debug("Stored {} byte(s) as '{}'", bytes.size(), reference.generic_string());
  return StageResult<std::string>::Ok(reference.generic_string());
}

auto MediaStore::StoreCopy(const file_path_t& source) -> StageResult<std::string> {
  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return StageResult<std::string>::Fail(ErrorCode::IO_ERROR,
                                          "Cannot read '" + source.string() + "'");
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  if (in.bad()) {
    return StageResult<std::string>::Fail(ErrorCode::IO_ERROR,
                                          "Failed to read '" + source.string() + "'");
  }
  return Store(bytes, LowercaseExtension(source));
}

auto MediaStore::Resolve(const std::string& reference) const -> file_path_t {
  return root_ / file_path_t(reference);
}

auto MediaStore::Remove(const std::string& reference) -> bool {
  std::error_code ec;
  bool            removed = std::filesystem::remove(Resolve(reference), ec);
  if (ec) {
    spdlog::warn("Cannot remove stored image '{}': {}", reference, ec.message());
    return false;
  }
  return removed;
}
};  // namespace oolong
