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
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace oolong {
// CREATE TABLE Photograph (id BIGINT PRIMARY KEY, content_hash VARCHAR UNIQUE, stored_image
// VARCHAR, capture_time TIMESTAMP, camera_model VARCHAR, has_errors BOOLEAN, created_at
// TIMESTAMP, updated_at TIMESTAMP);
struct PhotographMapperParams {
  photograph_id_t              id;
  std::unique_ptr<std::string> content_hash;
  std::unique_ptr<std::string> stored_image;
  std::unique_ptr<std::string> capture_time;
  std::unique_ptr<std::string> camera_model;
  bool                         has_errors;
  std::unique_ptr<std::string> created_at;
  std::unique_ptr<std::string> updated_at;
};

class PhotographMapper
    : public MapperInterface<PhotographMapper, PhotographMapperParams, photograph_id_t>,
      public FieldReflectable<PhotographMapper> {
 private:
  static constexpr uint32_t    field_count_      = 8;
  static constexpr const char* table_name_       = "Photograph";
  static constexpr const char* prime_key_clause_ = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, field_count_> field_descs_ = {
      FIELD(PhotographMapperParams, id, INT64),
      FIELD(PhotographMapperParams, content_hash, VARCHAR),
      FIELD(PhotographMapperParams, stored_image, VARCHAR),
      FIELD(PhotographMapperParams, capture_time, TIMESTAMP),
      FIELD(PhotographMapperParams, camera_model, VARCHAR),
      FIELD(PhotographMapperParams, has_errors, BOOLEAN),
      FIELD(PhotographMapperParams, created_at, TIMESTAMP),
      FIELD(PhotographMapperParams, updated_at, TIMESTAMP)};
  // content_hash is fixed once the record exists
  static constexpr std::array<duckorm::DuckFieldDesc, 5> update_field_descs_ = {
      FIELD(PhotographMapperParams, stored_image, VARCHAR),
      FIELD(PhotographMapperParams, capture_time, TIMESTAMP),
      FIELD(PhotographMapperParams, camera_model, VARCHAR),
      FIELD(PhotographMapperParams, has_errors, BOOLEAN),
      FIELD(PhotographMapperParams, updated_at, TIMESTAMP)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> PhotographMapperParams;
  friend struct FieldReflectable<PhotographMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace oolong
