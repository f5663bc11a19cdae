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

#include "image/metadata_extractor.hpp"

#include <libraw/libraw.h>
#include <spdlog/spdlog.h>

#include <array>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

#include "type/supported_file_type.hpp"
#include "utils/string/convert.hpp"

namespace oolong {
namespace {
constexpr std::array<const char*, 3> kCaptureTimeKeys = {
    "Exif.Photo.DateTimeOriginal", "Exif.Photo.DateTimeDigitized", "Exif.Image.DateTime"};

constexpr std::array<const char*, 2> kExifTimeFormats = {"%Y:%m:%d %H:%M:%S",
                                                         "%Y-%m-%d %H:%M:%S"};

auto TagValue(const Exiv2::ExifData& exif_data, const char* key) -> std::string {
  auto it = exif_data.findKey(Exiv2::ExifKey(key));
  if (it == exif_data.end()) {
    return {};
  }
  return conv::Trim(it->toString());
}

auto TmToTimePoint(std::tm& tm) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

auto LibRawThumbFormatName(LibRaw_thumbnail_formats format) -> const char* {
  switch (format) {
    case LIBRAW_THUMBNAIL_JPEG:
      return "jpeg";
    case LIBRAW_THUMBNAIL_BITMAP:
    case LIBRAW_THUMBNAIL_BITMAP16:
      return "bitmap";
    case LIBRAW_THUMBNAIL_LAYER:
      return "layer";
    case LIBRAW_THUMBNAIL_ROLLEI:
      return "rollei";
    default:
      return "unknown";
  }
}
}  // namespace

auto MetadataExtractor::ParseExifDateTime(std::string_view value)
    -> std::optional<std::chrono::system_clock::time_point> {
  std::string trimmed = conv::Trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  for (const char* format : kExifTimeFormats) {
    std::tm            tm{};
    std::istringstream iss(trimmed);
    iss >> std::get_time(&tm, format);
    if (iss.fail()) {
      continue;
    }
    // Trailing garbage such as sub-second digits is not accepted
    iss >> std::ws;
    if (!iss.eof()) {
      continue;
    }
    return TmToTimePoint(tm);
  }
  return std::nullopt;
}

auto MetadataExtractor::CleanCameraModel(std::string_view value) -> std::optional<std::string> {
  std::string without_nulls;
  without_nulls.reserve(value.size());
  for (char c : value) {
    if (c != '\0') without_nulls.push_back(c);
  }
  std::string cleaned = conv::Trim(without_nulls);
  if (cleaned.empty()) {
    return std::nullopt;
  }
  return conv::ToValidUtf8(cleaned);
}

auto MetadataExtractor::FromExif(const Exiv2::ExifData& exif_data) -> CaptureMetadata {
  CaptureMetadata metadata;
  if (exif_data.empty()) {
    return metadata;
  }
  for (const char* key : kCaptureTimeKeys) {
    std::string value = TagValue(exif_data, key);
    if (!value.empty()) {
      metadata.capture_time_ = ParseExifDateTime(value);
      break;
    }
  }
  auto model = exif_data.findKey(Exiv2::ExifKey("Exif.Image.Model"));
  if (model != exif_data.end()) {
    metadata.camera_model_ = CleanCameraModel(model->toString());
  }
  return metadata;
}

auto MetadataExtractor::ExtractEXIF(const image_path_t& image_path) -> Exiv2::Image::UniquePtr {
  Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open(image_path.string());
  image->readMetadata();
  return image;
}

auto MetadataExtractor::FromLibRaw(const image_path_t& image_path) -> CaptureMetadata {
  CaptureMetadata metadata;
  auto            processor = std::make_unique<LibRaw>();
  if (processor->open_file(image_path.string().c_str()) != LIBRAW_SUCCESS) {
    return metadata;
  }
  std::time_t timestamp = processor->imgdata.other.timestamp;
  if (timestamp > 0) {
    std::tm local{};
    if (localtime_r(&timestamp, &local)) {
      metadata.capture_time_ = TmToTimePoint(local);
    }
  }
  metadata.camera_model_ = CleanCameraModel(processor->imgdata.idata.model);
  processor->recycle();
  return metadata;
}

auto MetadataExtractor::Extract(const image_path_t& image_path) -> CaptureMetadata {
  CaptureMetadata metadata;
  try {
    auto image = ExtractEXIF(image_path);
    metadata   = FromExif(image->exifData());
  } catch (const Exiv2::Error& e) {
    spdlog::debug("MetadataExtractor: no readable tags in '{}': {}", image_path.string(),
                  e.what());
  }

  if (!metadata.capture_time_ && is_raw_file(image_path)) {
    CaptureMetadata raw = FromLibRaw(image_path);
    metadata.capture_time_ = raw.capture_time_;
    if (!metadata.camera_model_) {
      metadata.camera_model_ = raw.camera_model_;
    }
  }
  return metadata;
}

auto MetadataExtractor::EXIFToJSON(const Exiv2::ExifData& exif_data) -> nlohmann::json {
  nlohmann::json exif_json = nlohmann::json::object();
  for (const auto& datum : exif_data) {
    exif_json[datum.key()] = conv::ToValidUtf8(conv::Trim(datum.toString()));
  }
  return exif_json;
}

auto MetadataExtractor::ExtractRawInfo(const image_path_t& image_path) -> nlohmann::json {
  nlohmann::json raw_json = nlohmann::json::object();
  if (!is_raw_file(image_path)) {
    return raw_json;
  }
  auto processor = std::make_unique<LibRaw>();
  int  ret       = processor->open_file(image_path.string().c_str());
  if (ret != LIBRAW_SUCCESS) {
    spdlog::debug("MetadataExtractor: libraw open_file failed for '{}': {}",
                  image_path.string(), libraw_strerror(ret));
    return raw_json;
  }

  const auto& data         = processor->imgdata;
  raw_json["make"]         = conv::ToValidUtf8(conv::Trim(data.idata.make));
  raw_json["model"]        = conv::ToValidUtf8(conv::Trim(data.idata.model));
  raw_json["raw_width"]    = data.sizes.raw_width;
  raw_json["raw_height"]   = data.sizes.raw_height;
  raw_json["width"]        = data.sizes.width;
  raw_json["height"]       = data.sizes.height;
  raw_json["top_margin"]   = data.sizes.top_margin;
  raw_json["left_margin"]  = data.sizes.left_margin;
  raw_json["pixel_aspect"] = data.sizes.pixel_aspect;
  raw_json["colors"]       = data.idata.colors;
  raw_json["color_desc"]   = conv::ToValidUtf8(conv::Trim(data.idata.cdesc));
  raw_json["camera_whitebalance"] = {data.color.cam_mul[0], data.color.cam_mul[1],
                                     data.color.cam_mul[2], data.color.cam_mul[3]};
  if (data.thumbnail.tlength > 0) {
    raw_json["thumbnail"] = {{"format", LibRawThumbFormatName(data.thumbnail.tformat)},
                             {"width", data.thumbnail.twidth},
                             {"height", data.thumbnail.theight},
                             {"size", data.thumbnail.tlength}};
  }
  processor->recycle();
  return raw_json;
}
}  // namespace oolong
