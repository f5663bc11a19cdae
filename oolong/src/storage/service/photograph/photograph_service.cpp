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

#include "storage/service/photograph/photograph_service.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace oolong {
namespace {
auto ToNullable(const std::optional<std::string>& value) -> std::unique_ptr<std::string> {
  if (!value.has_value()) return nullptr;
  return std::make_unique<std::string>(conv::ToValidUtf8(*value));
}

auto FromNullable(std::unique_ptr<std::string>& value) -> std::optional<std::string> {
  if (!value) return std::nullopt;
  return std::move(*value);
}

auto ToNullableTime(const std::optional<std::chrono::system_clock::time_point>& tp)
    -> std::unique_ptr<std::string> {
  if (!tp.has_value()) return nullptr;
  return std::make_unique<std::string>(TimeProvider::ToSqlTimestamp(*tp));
}

auto FromNullableTime(const std::unique_ptr<std::string>& value)
    -> std::optional<std::chrono::system_clock::time_point> {
  if (!value) return std::nullopt;
  return TimeProvider::FromSqlTimestamp(*value);
}
}  // namespace

auto PhotographService::ToParams(const Photograph& source) -> PhotographMapperParams {
  return {source.id_,
          ToNullable(source.content_hash_),
          ToNullable(source.stored_image_),
          ToNullableTime(source.capture_time_),
          ToNullable(source.camera_model_),
          source.has_errors_,
          std::make_unique<std::string>(TimeProvider::ToSqlTimestamp(source.created_at_)),
          std::make_unique<std::string>(TimeProvider::ToSqlTimestamp(source.updated_at_))};
}

auto PhotographService::FromParams(PhotographMapperParams&& param) -> Photograph {
  Photograph recovered;
  recovered.id_           = param.id;
  recovered.content_hash_ = FromNullable(param.content_hash);
  recovered.stored_image_ = FromNullable(param.stored_image);
  recovered.capture_time_ = FromNullableTime(param.capture_time);
  recovered.camera_model_ = FromNullable(param.camera_model);
  recovered.has_errors_   = param.has_errors;
  recovered.created_at_   = FromNullableTime(param.created_at).value_or(
      std::chrono::system_clock::time_point{});
  recovered.updated_at_ = FromNullableTime(param.updated_at).value_or(
      std::chrono::system_clock::time_point{});
  return recovered;
}

auto PhotographService::GetPhotographById(const photograph_id_t id) -> std::optional<Photograph> {
  std::array<std::string, 1> params{std::to_string(id)};
  auto                       found = GetByPredicate("id = CAST(? AS BIGINT)", params);
  if (found.empty()) return std::nullopt;
  return std::move(found.front());
}

auto PhotographService::GetPhotographByHash(const std::string& content_hash)
    -> std::optional<Photograph> {
  std::array<std::string, 1> params{content_hash};
  auto                       found = GetByPredicate("content_hash = ?", params);
  if (found.empty()) return std::nullopt;
  return std::move(found.front());
}
};  // namespace oolong
