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

#include <opencv2/core.hpp>
#include <string>
#include <unordered_set>
#include <utility>

#include "decoders/image_backend.hpp"
#include "type/supported_file_type.hpp"

namespace oolong {
class LibRawBackend final : public ImageBackend {
 public:
  LibRawBackend() : extensions_(raw_extensions) {}
  explicit LibRawBackend(std::unordered_set<std::string> extensions)
      : extensions_(std::move(extensions)) {}

  auto        Name() const -> std::string override { return "libraw"; }
  auto        CanProcess(const image_path_t& path) const -> bool override;
  auto        Decode(const image_path_t& path, ImageFormatType fmt,
                     const std::optional<Resolution>& resolution)
      -> std::optional<std::vector<uint8_t>> override;

  static auto IsAvailable() -> bool;

  /**
   * @brief Decode a RAW file to a BGR bitmap. The embedded preview is used when it is
   *        present and decodable, otherwise the sensor data is demosaiced.
   *
   * @param path
   * @return cv::Mat empty on failure
   */
  static auto DecodeToMat(const image_path_t& path) -> cv::Mat;

  static auto ExtractPreview(const image_path_t& path) -> cv::Mat;
  static auto DecodeSensorData(const image_path_t& path) -> cv::Mat;

 private:
  std::unordered_set<std::string> extensions_;
};
};  // namespace oolong
