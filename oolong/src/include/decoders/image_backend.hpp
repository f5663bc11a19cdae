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
#include <optional>
#include <string>
#include <vector>

#include "io/image/transcoder.hpp"
#include "resolution/resolution.hpp"
#include "type/type.hpp"

namespace oolong {
/**
 * @brief Decoder for a file format that needs special handling before it can be stored
 *        as a standard bitmap.
 */
class ImageBackend {
 public:
  virtual ~ImageBackend() = default;

  virtual auto Name() const -> std::string = 0;

  /**
   * @brief True only when the decoding capability is available and the file exists with
   *        an extension this backend handles.
   */
  virtual auto CanProcess(const image_path_t& path) const -> bool = 0;

  /**
   * @brief Produce an encoded standard-format bitmap, resized when a resolution is given.
   *
   * @return std::optional<std::vector<uint8_t>> nullopt on any decode failure
   */
  virtual auto Decode(const image_path_t& path, ImageFormatType fmt,
                      const std::optional<Resolution>& resolution)
      -> std::optional<std::vector<uint8_t>> = 0;
};
};  // namespace oolong
