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

#include <duckdb.h>

#include <optional>
#include <string>
#include <vector>

#include "catalog/photo_path.hpp"
#include "storage/mapper/photo_path/photo_path_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace oolong {
class PhotoPathService : public ServiceInterface<PhotoPathService, PhotoPath, PhotoPathMapperParams,
                                                 PhotoPathMapper, photo_path_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const PhotoPath& source) -> PhotoPathMapperParams;
  static auto FromParams(PhotoPathMapperParams&& param) -> PhotoPath;

  auto        GetByLocation(const std::string& path, const device_id_t& device)
      -> std::optional<PhotoPath>;
  auto        GetByPhotograph(const photograph_id_t photograph_id) -> std::vector<PhotoPath>;

  // Null the photograph reference of every path pointing at the photograph
  void        ClearPhotographReference(const photograph_id_t photograph_id);
};
};  // namespace oolong
