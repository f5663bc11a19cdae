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

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <unordered_set>

namespace fs = std::filesystem;

namespace oolong {
static const std::unordered_set<std::string> raster_extensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif", ".webp", ".heic", ".heif"};

static const std::unordered_set<std::string> raw_extensions = {
    ".raw", ".cr2", ".nef", ".orf", ".sr2", ".arw", ".dng", ".raf", ".rw2", ".pef",
    ".srw", ".3fr", ".mef", ".mos", ".ari", ".bay", ".crw", ".cap", ".dcs", ".dcr",
    ".drf", ".eip", ".erf", ".fff", ".iiq", ".k25", ".kdc", ".mdc", ".mrw", ".nrw",
    ".obm", ".pbm", ".pxn", ".r3d", ".rwl", ".rwz", ".x3f", ".srf"};

inline auto LowercaseExtension(const fs::path& path) -> std::string {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

inline bool is_raw_file(const fs::path& path) {
  return raw_extensions.count(LowercaseExtension(path)) > 0;
}

inline bool is_supported_extension(const fs::path& path) {
  std::string ext = LowercaseExtension(path);
  return raster_extensions.count(ext) > 0 || raw_extensions.count(ext) > 0;
}

inline bool is_supported_file(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return false;
  return is_supported_extension(path);
}
};  // namespace oolong
