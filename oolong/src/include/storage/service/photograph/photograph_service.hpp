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

#include "catalog/photograph.hpp"
#include "storage/mapper/photograph/photograph_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace oolong {
class PhotographService : public ServiceInterface<PhotographService, Photograph,
                                                  PhotographMapperParams, PhotographMapper,
                                                  photograph_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Photograph& source) -> PhotographMapperParams;
  static auto FromParams(PhotographMapperParams&& param) -> Photograph;

  auto        GetPhotographById(const photograph_id_t id) -> std::optional<Photograph>;
  auto        GetPhotographByHash(const std::string& content_hash) -> std::optional<Photograph>;
};
};  // namespace oolong
