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
#include <utility>

namespace oolong {
enum class ErrorCode : uint8_t {
  NONE = 0,
  IO_ERROR,
  HASH_ERROR,
  DECODE_ERROR,
  RESOLUTION_PARSE_ERROR,
  MOUNT_RESOLUTION_ERROR,
  METADATA_ERROR,
  DB_WRITE_FAILED,
  CANCELED
};

inline auto ErrorCodeName(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::NONE:
      return "None";
    case ErrorCode::IO_ERROR:
      return "IOError";
    case ErrorCode::HASH_ERROR:
      return "HashError";
    case ErrorCode::DECODE_ERROR:
      return "DecodeError";
    case ErrorCode::RESOLUTION_PARSE_ERROR:
      return "ResolutionParseError";
    case ErrorCode::MOUNT_RESOLUTION_ERROR:
      return "MountResolutionError";
    case ErrorCode::METADATA_ERROR:
      return "MetadataError";
    case ErrorCode::DB_WRITE_FAILED:
      return "DBWriteFailed";
    case ErrorCode::CANCELED:
      return "Canceled";
  }
  return "Unknown";
}

/**
 * @brief Outcome of one pipeline stage. Either holds a value or an error code with a
 *        human-readable message, never both.
 */
template <typename T>
struct StageResult {
  std::optional<T> value_{};
  ErrorCode        code_ = ErrorCode::NONE;
  std::string      message_{};

  static auto      Ok(T value) -> StageResult<T> {
    StageResult<T> result;
    result.value_ = std::move(value);
    return result;
  }

  static auto Fail(ErrorCode code, std::string message) -> StageResult<T> {
    StageResult<T> result;
    result.code_    = code;
    result.message_ = std::move(message);
    return result;
  }

  auto IsOk() const -> bool { return value_.has_value(); }
  explicit operator bool() const { return IsOk(); }
};
};  // namespace oolong
