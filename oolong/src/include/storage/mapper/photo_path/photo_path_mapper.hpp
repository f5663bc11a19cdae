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

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace oolong {
// CREATE TABLE PhotoPath (id BIGINT PRIMARY KEY, path VARCHAR NOT NULL, device VARCHAR NOT
// NULL, size BIGINT, file_created_at TIMESTAMP, file_modified_at TIMESTAMP, photograph_id
// BIGINT, created_at TIMESTAMP, updated_at TIMESTAMP, UNIQUE (path, device));
struct PhotoPathMapperParams {
  photo_path_id_t                id;
  std::unique_ptr<std::string>   path;
  std::unique_ptr<std::string>   device;
  int64_t                        size;
  std::unique_ptr<std::string>   file_created_at;
  std::unique_ptr<std::string>   file_modified_at;
  std::optional<photograph_id_t> photograph_id;
  std::unique_ptr<std::string>   created_at;
  std::unique_ptr<std::string>   updated_at;
};

class PhotoPathMapper
    : public MapperInterface<PhotoPathMapper, PhotoPathMapperParams, photo_path_id_t>,
      public FieldReflectable<PhotoPathMapper> {
 private:
  static constexpr uint32_t    field_count_      = 9;
  static constexpr const char* table_name_       = "PhotoPath";
  static constexpr const char* prime_key_clause_ = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(PhotoPathMapperParams, id, INT64),
      FIELD(PhotoPathMapperParams, path, VARCHAR),
      FIELD(PhotoPathMapperParams, device, VARCHAR),
      FIELD(PhotoPathMapperParams, size, INT64),
      FIELD(PhotoPathMapperParams, file_created_at, TIMESTAMP),
      FIELD(PhotoPathMapperParams, file_modified_at, TIMESTAMP),
      FIELD(PhotoPathMapperParams, photograph_id, NULLABLE_INT64),
      FIELD(PhotoPathMapperParams, created_at, TIMESTAMP),
      FIELD(PhotoPathMapperParams, updated_at, TIMESTAMP)};
  // (path, device) identifies the row and is never rewritten
  static constexpr std::array<duckorm::DuckFieldDesc, 5> update_field_descs_ = {
      FIELD(PhotoPathMapperParams, size, INT64),
      FIELD(PhotoPathMapperParams, file_created_at, TIMESTAMP),
      FIELD(PhotoPathMapperParams, file_modified_at, TIMESTAMP),
      FIELD(PhotoPathMapperParams, photograph_id, NULLABLE_INT64),
      FIELD(PhotoPathMapperParams, updated_at, TIMESTAMP)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> PhotoPathMapperParams;
  friend struct FieldReflectable<PhotoPathMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace oolong
