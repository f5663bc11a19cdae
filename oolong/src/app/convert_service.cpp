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

#include "app/convert_service.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

#include "resolution/resolution.hpp"

namespace oolong {
namespace {
auto WriteBytes(const file_path_t& dst, const std::vector<uint8_t>& bytes) -> bool {
  std::ofstream out(dst, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  out.close();
  return static_cast<bool>(out);
}
}  // namespace

ConvertService::ConvertService(std::shared_ptr<BackendRegistry> backends)
    : backends_(std::move(backends)) {
  if (!backends_) {
    backends_ = std::make_shared<BackendRegistry>();
  }
}

auto ConvertService::ResolveOutputPath(const file_path_t& src,
                                       const std::optional<std::string>& output,
                                       ImageFormatType fmt) -> file_path_t {
  const std::string ext = ImageFormatExtension(fmt);
  if (!output.has_value() || output->empty()) {
    return file_path_t(src).replace_extension(ext);
  }
  file_path_t     out(*output);
  std::error_code ec;
  if (std::filesystem::is_directory(out, ec) || output->back() == '/') {
    return out / file_path_t(src.filename()).replace_extension(ext);
  }
  return out.replace_extension(ext);
}

auto ConvertService::ConvertImage(const file_path_t& src, const file_path_t& dst,
                                  const std::optional<std::string>& resolution,
                                  ImageFormatType fmt) -> StageResult<file_path_t> {
  std::error_code ec;
  if (!std::filesystem::exists(src, ec)) {
    spdlog::error("Source file does not exist: {}", src.string());
    return StageResult<file_path_t>::Fail(ErrorCode::IO_ERROR,
                                          "Source file does not exist: " + src.string());
  }

  file_path_t dst_dir = dst.has_parent_path() ? dst.parent_path() : file_path_t(".");
  std::filesystem::create_directories(dst_dir, ec);
  if (ec) {
    return StageResult<file_path_t>::Fail(
        ErrorCode::IO_ERROR,
        "Cannot create destination directory '" + dst_dir.string() + "': " + ec.message());
  }

  std::optional<Resolution> target;
  if (resolution.has_value() && !resolution->empty()) {
    target = ResolutionResolver::Parse(*resolution);
    if (!target.has_value()) {
      spdlog::warn("Invalid resolution format: {}. Ignoring resolution parameter.", *resolution);
    }
  }

  auto src_size = std::filesystem::file_size(src, ec);
  if (ec) {
    return StageResult<file_path_t>::Fail(ErrorCode::IO_ERROR,
                                          "Cannot read '" + src.string() + "': " + ec.message());
  }
  // Decoding a RAW file can grow the output beyond the source size
  uintmax_t required = target.has_value() ? src_size * 2 : src_size;
  auto      space    = std::filesystem::space(dst_dir, ec);
  if (!ec && space.available < required) {
    spdlog::error("Not enough disk space at destination: {}", dst_dir.string());
    return StageResult<file_path_t>::Fail(
        ErrorCode::IO_ERROR, "Not enough disk space at destination: " + dst_dir.string());
  }

  std::vector<uint8_t> bytes;
  auto                 backend = backends_->GetBackend(src);
  if (backend) {
    try {
      auto decoded = backend->Decode(src, fmt, target);
      if (decoded.has_value()) bytes = std::move(*decoded);
    } catch (const std::exception& e) {
      spdlog::warn("Backend {} failed on '{}': {}", backend->Name(), src.string(), e.what());
    }
  }

  if (bytes.empty()) {
    auto bitmap = Transcoder::DecodeFile(src);
    if (bitmap.empty()) {
      return StageResult<file_path_t>::Fail(ErrorCode::DECODE_ERROR,
                                            "Cannot decode '" + src.string() + "'");
    }
    try {
      bytes = Transcoder::ResizeAndEncode(bitmap, target, fmt);
    } catch (const std::exception& e) {
      spdlog::error("Failed to convert {} to {}: {}", src.string(), dst.string(), e.what());
      return StageResult<file_path_t>::Fail(ErrorCode::DECODE_ERROR, e.what());
    }
  }

  if (!WriteBytes(dst, bytes)) {
    return StageResult<file_path_t>::Fail(ErrorCode::IO_ERROR,
                                          "Failed to write '" + dst.string() + "'");
  }
  spdlog::info("Successfully converted {} to {}", src.string(), dst.string());
  return StageResult<file_path_t>::Ok(dst);
}
};  // namespace oolong
