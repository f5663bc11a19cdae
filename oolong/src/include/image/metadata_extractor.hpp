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
#include <exiv2/exiv2.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "image/metadata.hpp"
#include "type/type.hpp"

namespace oolong {
class MetadataExtractor {
 public:
  /**
   * @brief Read capture time and camera model from the embedded tags of a file. Tags are
   *        read once. Unreadable files or files without tags yield empty metadata.
   *
   * @param image_path
   * @return CaptureMetadata
   */
  static auto Extract(const image_path_t& image_path) -> CaptureMetadata;

  /**
   * @brief Capture time priority is DateTimeOriginal, DateTimeDigitized, then DateTime.
   *        The first non-empty tag wins, even when it does not parse.
   *
   * @param exif_data
   * @return CaptureMetadata
   */
  static auto FromExif(const Exiv2::ExifData& exif_data) -> CaptureMetadata;

  /**
   * @brief Extract EXIF metadata from image file
   *
   * @param image_path
   * @return Exiv2::Image::UniquePtr
   */
  static auto ExtractEXIF(const image_path_t& image_path) -> Exiv2::Image::UniquePtr;

  // Every Exif tag as "Exif.Group.Tag": "value"
  static auto EXIFToJSON(const Exiv2::ExifData& exif_data) -> nlohmann::json;

  // LibRaw sizes, colour description and preview properties, empty for non-RAW files
  static auto ExtractRawInfo(const image_path_t& image_path) -> nlohmann::json;

  // "YYYY:MM:DD HH:MM:SS" or "YYYY-MM-DD HH:MM:SS"
  static auto ParseExifDateTime(std::string_view value)
      -> std::optional<std::chrono::system_clock::time_point>;

  // Null bytes and surrounding whitespace removed, empty becomes nullopt
  static auto CleanCameraModel(std::string_view value) -> std::optional<std::string>;

 private:
  static auto FromLibRaw(const image_path_t& image_path) -> CaptureMetadata;
};
}  // namespace oolong
