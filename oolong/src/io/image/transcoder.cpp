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

#include "io/image/transcoder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace oolong {
namespace {
auto To8Bit(const cv::Mat& src) -> cv::Mat {
  switch (src.depth()) {
    case CV_8U:
      return src;
    case CV_16U: {
      cv::Mat u8;
      src.convertTo(u8, CV_MAKETYPE(CV_8U, src.channels()), 1.0 / 257.0);
      return u8;
    }
    case CV_32F:
    case CV_64F: {
      cv::Mat u8;
      src.convertTo(u8, CV_MAKETYPE(CV_8U, src.channels()), 255.0);
      return u8;
    }
    default: {
      cv::Mat u8;
      src.convertTo(u8, CV_MAKETYPE(CV_8U, src.channels()));
      return u8;
    }
  }
}

// Composite colour planes over opaque white using the last plane as coverage
auto CompositeOnWhite(const cv::Mat& src) -> cv::Mat {
  std::vector<cv::Mat> planes;
  cv::split(src, planes);
  const size_t color_planes = planes.size() - 1;

  cv::Mat      alpha;
  planes.back().convertTo(alpha, CV_32F, 1.0 / 255.0);
  cv::Mat inv_white = (1.0 - alpha) * 255.0;

  std::vector<cv::Mat> out(color_planes);
  for (size_t i = 0; i < color_planes; ++i) {
    cv::Mat plane;
    planes[i].convertTo(plane, CV_32F);
    cv::Mat blended = plane.mul(alpha) + inv_white;
    blended.convertTo(out[i], CV_8U);
  }
  cv::Mat merged;
  cv::merge(out, merged);
  return merged;
}
}  // namespace

auto ParseImageFormat(std::string_view name) -> std::optional<ImageFormatType> {
  std::string lower = conv::ToLower(conv::Trim(name));
  if (lower == "jpeg" || lower == "jpg") return ImageFormatType::JPEG;
  if (lower == "png") return ImageFormatType::PNG;
  return std::nullopt;
}

auto ImageFormatName(ImageFormatType fmt) -> const char* {
  return fmt == ImageFormatType::PNG ? "PNG" : "JPEG";
}

auto ImageFormatExtension(ImageFormatType fmt) -> const char* {
  return fmt == ImageFormatType::PNG ? ".png" : ".jpg";
}

auto Transcoder::ComputeTargetSize(int src_width, int src_height, const Resolution& target)
    -> cv::Size {
  if (src_width <= 0 || src_height <= 0 || target.width_ == 0 || target.height_ == 0) {
    throw std::invalid_argument("Transcoder: image and target sizes must be positive");
  }
  const int64_t sw = src_width;
  const int64_t sh = src_height;
  const int64_t tw = target.width_;
  const int64_t th = target.height_;

  int64_t       width;
  int64_t       height;
  if (sw * th > tw * sh) {
    width  = tw;
    height = tw * sh / sw;
  } else {
    height = th;
    width  = th * sw / sh;
  }
  return {static_cast<int>(std::max<int64_t>(1, width)),
          static_cast<int>(std::max<int64_t>(1, height))};
}

auto Transcoder::Resize(const cv::Mat& src, const Resolution& target) -> cv::Mat {
  if (src.empty()) {
    throw std::invalid_argument("Transcoder: cannot resize an empty image");
  }
  cv::Size size = ComputeTargetSize(src.cols, src.rows, target);
  if (size.width == src.cols && size.height == src.rows) {
    return src;
  }
  cv::Mat resized;
  cv::resize(src, resized, size, 0.0, 0.0, cv::INTER_LANCZOS4);
  spdlog::debug("Resized {}x{} -> {}x{} (requested {})", src.cols, src.rows, size.width,
                size.height, target.ToString());
  return resized;
}

auto Transcoder::NormalizeForFormat(const cv::Mat& src, ImageFormatType fmt) -> cv::Mat {
  cv::Mat u8 = To8Bit(src);
  if (fmt == ImageFormatType::JPEG && (u8.channels() == 4 || u8.channels() == 2)) {
    return CompositeOnWhite(u8);
  }
  return u8;
}

auto Transcoder::Encode(const cv::Mat& src, ImageFormatType fmt) -> std::vector<uint8_t> {
  if (src.empty()) {
    throw std::invalid_argument("Transcoder: cannot encode an empty image");
  }
  cv::Mat          normalized = NormalizeForFormat(src, fmt);
  std::vector<int> params;
  if (fmt == ImageFormatType::JPEG) {
    params = {cv::IMWRITE_JPEG_QUALITY, kJpegQuality};
  } else {
    params = {cv::IMWRITE_PNG_COMPRESSION, kPngCompression};
  }

  std::vector<uint8_t> encoded;
  if (!cv::imencode(ImageFormatExtension(fmt), normalized, encoded, params)) {
    throw std::runtime_error(
        std::string("Transcoder: failed to encode image as ") + ImageFormatName(fmt));
  }
  return encoded;
}

auto Transcoder::ResizeAndEncode(const cv::Mat& src, const std::optional<Resolution>& target,
                                 ImageFormatType fmt) -> std::vector<uint8_t> {
  if (target) {
    return Encode(Resize(src, *target), fmt);
  }
  return Encode(src, fmt);
}

auto Transcoder::DecodeFile(const image_path_t& path) -> cv::Mat {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return {};
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  return DecodeBuffer(bytes);
}

auto Transcoder::DecodeBuffer(std::span<const uint8_t> bytes) -> cv::Mat {
  if (bytes.empty()) {
    return {};
  }
  cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
  try {
    return cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    spdlog::debug("imdecode rejected buffer: {}", e.what());
    return {};
  }
}
};  // namespace oolong
