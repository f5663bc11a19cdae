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

#include "decoders/raw_backend.hpp"

#include <libraw/libraw.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace oolong {
namespace {
struct ProcessedImageDeleter {
  void operator()(libraw_processed_image_t* image) const { LibRaw::dcraw_clear_mem(image); }
};
using ProcessedImagePtr = std::unique_ptr<libraw_processed_image_t, ProcessedImageDeleter>;

auto OpenRaw(LibRaw& processor, const image_path_t& path) -> bool {
  int ret = processor.open_file(path.string().c_str());
  if (ret != LIBRAW_SUCCESS) {
    spdlog::debug("LibRawBackend: open_file failed for '{}': {}", path.string(),
                  libraw_strerror(ret));
    return false;
  }
  return true;
}

// Wrap a LibRaw bitmap into an owned BGR (or gray) Mat
auto BitmapToMat(const libraw_processed_image_t& image) -> cv::Mat {
  const int depth = image.bits == 16 ? CV_16U : CV_8U;
  if (image.colors == 3) {
    cv::Mat rgb(image.height, image.width, CV_MAKETYPE(depth, 3),
                const_cast<unsigned char*>(image.data));
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    return bgr;
  }
  if (image.colors == 1) {
    cv::Mat gray(image.height, image.width, CV_MAKETYPE(depth, 1),
                 const_cast<unsigned char*>(image.data));
    return gray.clone();
  }
  return {};
}
}  // namespace

auto LibRawBackend::IsAvailable() -> bool { return LibRaw::cameraCount() > 0; }

auto LibRawBackend::CanProcess(const image_path_t& path) const -> bool {
  if (!IsAvailable()) {
    return false;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }
  return extensions_.count(LowercaseExtension(path)) > 0;
}

auto LibRawBackend::ExtractPreview(const image_path_t& path) -> cv::Mat {
  auto processor = std::make_unique<LibRaw>();
  if (!OpenRaw(*processor, path)) {
    return {};
  }
  if (processor->unpack_thumb() != LIBRAW_SUCCESS) {
    return {};
  }

  int               err = 0;
  ProcessedImagePtr thumbnail(processor->dcraw_make_mem_thumb(&err));
  if (!thumbnail) {
    spdlog::debug("LibRawBackend: no usable preview in '{}': {}", path.string(),
                  libraw_strerror(err));
    return {};
  }

  cv::Mat img;
  if (thumbnail->type == LIBRAW_IMAGE_JPEG) {
    std::vector<uchar> jpeg_data(thumbnail->data, thumbnail->data + thumbnail->data_size);
    img = cv::imdecode(jpeg_data, cv::IMREAD_COLOR);
  } else if (thumbnail->type == LIBRAW_IMAGE_BITMAP) {
    img = BitmapToMat(*thumbnail);
  }
  processor->recycle();
  return img;
}

auto LibRawBackend::DecodeSensorData(const image_path_t& path) -> cv::Mat {
  auto processor = std::make_unique<LibRaw>();
  if (!OpenRaw(*processor, path)) {
    return {};
  }
  int ret = processor->unpack();
  if (ret != LIBRAW_SUCCESS) {
    spdlog::debug("LibRawBackend: unpack failed for '{}': {}", path.string(),
                  libraw_strerror(ret));
    return {};
  }

  processor->imgdata.params.output_bps   = 8;
  processor->imgdata.params.use_camera_wb = 1;
  ret                                     = processor->dcraw_process();
  if (ret != LIBRAW_SUCCESS) {
    spdlog::debug("LibRawBackend: dcraw_process failed for '{}': {}", path.string(),
                  libraw_strerror(ret));
    return {};
  }

  int               err = 0;
  ProcessedImagePtr image(processor->dcraw_make_mem_image(&err));
  if (!image || image->type != LIBRAW_IMAGE_BITMAP) {
    return {};
  }
  cv::Mat img = BitmapToMat(*image);
  processor->recycle();
  return img;
}

auto LibRawBackend::DecodeToMat(const image_path_t& path) -> cv::Mat {
  cv::Mat img = ExtractPreview(path);
  if (!img.empty()) {
    spdlog::debug("LibRawBackend: using embedded preview of '{}'", path.string());
    return img;
  }
  return DecodeSensorData(path);
}

auto LibRawBackend::Decode(const image_path_t& path, ImageFormatType fmt,
                           const std::optional<Resolution>& resolution)
    -> std::optional<std::vector<uint8_t>> {
  try {
    cv::Mat img = DecodeToMat(path);
    if (img.empty()) {
      spdlog::warn("LibRawBackend: failed to decode '{}'", path.string());
      return std::nullopt;
    }
    return Transcoder::ResizeAndEncode(img, resolution, fmt);
  } catch (const std::exception& e) {
    spdlog::warn("LibRawBackend: error decoding '{}': {}", path.string(), e.what());
    return std::nullopt;
  }
}
};  // namespace oolong
