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

#include "app/inspect_service.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <opencv2/core.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

#include "image/metadata_extractor.hpp"
#include "io/image/transcoder.hpp"
#include "type/supported_file_type.hpp"

namespace oolong {
namespace {
auto DepthName(int depth) -> const char* {
  switch (depth) {
    case CV_8U:
      return "8U";
    case CV_8S:
      return "8S";
    case CV_16U:
      return "16U";
    case CV_16S:
      return "16S";
    case CV_32S:
      return "32S";
    case CV_32F:
      return "32F";
    case CV_64F:
      return "64F";
    default:
      return "unknown";
  }
}

auto HasTransparency(const cv::Mat& bitmap) -> bool {
  if (bitmap.channels() != 4) return false;
  cv::Mat alpha;
  cv::extractChannel(bitmap, alpha, 3);
  double min_value = 0.0;
  double max_value = 0.0;
  cv::minMaxLoc(alpha, &min_value, &max_value);
  double opaque = bitmap.depth() == CV_16U ? 65535.0 : 255.0;
  return min_value < opaque;
}
}  // namespace

InspectService::InspectService(std::shared_ptr<BackendRegistry> backends)
    : backends_(std::move(backends)) {
  if (!backends_) {
    backends_ = std::make_shared<BackendRegistry>();
  }
}

auto InspectService::DescribeImage(const image_path_t& path) -> nlohmann::json {
  nlohmann::json image = nlohmann::json::object();
  cv::Mat        bitmap;
  auto           backend = backends_->GetBackend(path);
  if (backend) {
    auto preview = backend->Decode(path, ImageFormatType::PNG, std::nullopt);
    if (preview.has_value()) {
      bitmap = Transcoder::DecodeBuffer(*preview);
    }
  }
  if (bitmap.empty()) {
    bitmap = Transcoder::DecodeFile(path);
  }
  if (bitmap.empty()) {
    return image;
  }
  image["width"]            = bitmap.cols;
  image["height"]           = bitmap.rows;
  image["channels"]         = bitmap.channels();
  image["depth"]            = DepthName(bitmap.depth());
  image["has_transparency"] = HasTransparency(bitmap);
  return image;
}

auto InspectService::InspectFile(const image_path_t& path) -> nlohmann::json {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw std::invalid_argument("File does not exist: " + path.string());
  }

  uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) size = 0;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) absolute = path;

  nlohmann::json report;
  report["file"] = {{"path", absolute.string()},
                    {"name", path.filename().string()},
                    {"extension", LowercaseExtension(path)},
                    {"size", size},
                    {"size_mb", std::round(static_cast<double>(size) / (1024.0 * 1024.0) * 100.0) /
                                    100.0}};

  report["image"] = DescribeImage(path);

  report["exif"]  = nlohmann::json::object();
  try {
    auto exif_image = MetadataExtractor::ExtractEXIF(path);
    report["exif"]  = MetadataExtractor::EXIFToJSON(exif_image->exifData());
  } catch (const Exiv2::Error& e) {
    spdlog::debug("No readable EXIF in '{}': {}", path.string(), e.what());
  }

  report["raw"] = MetadataExtractor::ExtractRawInfo(path);
  return report;
}
};  // namespace oolong
