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

#include "storage/service/photo_path/photo_path_service.hpp"

#include <array>
#include <format>
#include <memory>
#include <string>
#include <utility>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace oolong {
namespace {
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

auto PhotoPathService::ToParams(const PhotoPath& source) -> PhotoPathMapperParams {
  return {source.id_,
          std::make_unique<std::string>(conv::ToValidUtf8(source.path_)),
          std::make_unique<std::string>(conv::ToValidUtf8(source.device_)),
          source.size_,
          ToNullableTime(source.file_created_at_),
          ToNullableTime(source.file_modified_at_),
          source.photograph_id_,
          std::make_unique<std::string>(TimeProvider::ToSqlTimestamp(source.created_at_)),
          std::make_unique<std::string>(TimeProvider::ToSqlTimestamp(source.updated_at_))};
}

auto PhotoPathService::FromParams(PhotoPathMapperParams&& param) -> PhotoPath {
  PhotoPath recovered;
  recovered.id_               = param.id;
  recovered.path_             = std::move(*param.path);
  recovered.device_           = std::move(*param.device);
  recovered.size_             = param.size;
  recovered.file_created_at_  = FromNullableTime(param.file_created_at);
  recovered.file_modified_at_ = FromNullableTime(param.file_modified_at);
  recovered.photograph_id_    = param.photograph_id;
  recovered.created_at_       = FromNullableTime(param.created_at).value_or(
      std::chrono::system_clock::time_point{});
  recovered.updated_at_ = FromNullableTime(param.updated_at).value_or(
      std::chrono::system_clock::time_point{});
  return recovered;
}

auto PhotoPathService::GetByLocation(const std::string& path, const device_id_t& device)
    -> std::optional<PhotoPath> {
  // Stored values went through ToValidUtf8, the lookup has to match them
  std::array<std::string, 2> params{conv::ToValidUtf8(path), conv::ToValidUtf8(device)};
  auto                       found = GetByPredicate("path = ? AND device = ?", params);
  if (found.empty()) return std::nullopt;
  return std::move(found.front());
}

auto PhotoPathService::GetByPhotograph(const photograph_id_t photograph_id)
    -> std::vector<PhotoPath> {
  std::array<std::string, 1> params{std::to_string(photograph_id)};
  return GetByPredicate("photograph_id = CAST(? AS BIGINT) ORDER BY id", params);
}

void PhotoPathService::ClearPhotographReference(const photograph_id_t photograph_id) {
  duckorm::execute(conn_, std::format("UPDATE {} SET photograph_id = NULL WHERE photograph_id = {};",
                                      PhotoPathMapper::TableName(), photograph_id));
}
};  // namespace oolong
