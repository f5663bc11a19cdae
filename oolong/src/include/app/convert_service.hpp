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

#include <memory>
#include <optional>
#include <string>

#include "decoders/backend_registry.hpp"
#include "io/image/transcoder.hpp"
#include "type/stage_result.hpp"
#include "type/type.hpp"

namespace oolong {
class ConvertService {
 public:
  explicit ConvertService(std::shared_ptr<BackendRegistry> backends);

  /**
   * @brief Convert one image file to a standard format, optionally resized. Formats with a
   *        registered backend go through it first, everything else is decoded with OpenCV.
   *        An invalid resolution is ignored with a warning.
   *
   * @param src
   * @param dst
   * @param resolution
   * @param fmt
   * @return StageResult<file_path_t> dst on success, IO_ERROR for a missing source or a
   *         full destination, DECODE_ERROR when the image cannot be decoded or encoded
   */
  auto ConvertImage(const file_path_t& src, const file_path_t& dst,
                    const std::optional<std::string>& resolution, ImageFormatType fmt)
      -> StageResult<file_path_t>;

  /**
   * @brief Destination of a conversion. Without an output the source path is used with the
   *        format's extension, an existing directory (or a path ending in a separator)
   *        receives <stem><ext>, any other output gets its extension replaced.
   */
  static auto ResolveOutputPath(const file_path_t& src, const std::optional<std::string>& output,
                                ImageFormatType fmt) -> file_path_t;

 private:
  std::shared_ptr<BackendRegistry> backends_;
};
};  // namespace oolong
