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
#include <opencv2/core.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "resolution/resolution.hpp"
#include "type/type.hpp"

namespace oolong {
enum class ImageFormatType : uint8_t { JPEG, PNG };

auto ParseImageFormat(std::string_view name) -> std::optional<ImageFormatType>;
auto ImageFormatName(ImageFormatType fmt) -> const char*;
auto ImageFormatExtension(ImageFormatType fmt) -> const char*;

class Transcoder {
 public:
  static constexpr int kJpegQuality      = 95;
  static constexpr int kPngCompression   = 3;

  /**
   * @brief Aspect-preserving size that fits into the target. A source relatively wider
   *        than the target is fitted to the target width, otherwise to the target height.
   *
   * @param src_width
   * @param src_height
   * @param target
   * @return cv::Size
   */
  static auto ComputeTargetSize(int src_width, int src_height, const Resolution& target)
      -> cv::Size;

  static auto Resize(const cv::Mat& src, const Resolution& target) -> cv::Mat;

  /**
   * @brief Bring a bitmap into a shape the output format can hold: 8-bit depth, and for
   *        JPEG no alpha channel (alpha is composited onto opaque white).
   *
   * @param src
   * @param fmt
   * @return cv::Mat
   */
  static auto NormalizeForFormat(const cv::Mat& src, ImageFormatType fmt) -> cv::Mat;

  static auto Encode(const cv::Mat& src, ImageFormatType fmt) -> std::vector<uint8_t>;

  static auto ResizeAndEncode(const cv::Mat& src, const std::optional<Resolution>& target,
                              ImageFormatType fmt) -> std::vector<uint8_t>;

  // Both decoders keep alpha and bit depth, an empty Mat means the data is not decodable
  static auto DecodeFile(const image_path_t& path) -> cv::Mat;
  static auto DecodeBuffer(std::span<const uint8_t> bytes) -> cv::Mat;
};
};  // namespace oolong
