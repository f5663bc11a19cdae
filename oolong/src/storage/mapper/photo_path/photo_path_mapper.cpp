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

#include "storage/mapper/photo_path/photo_path_mapper.hpp"

#include <stdexcept>

namespace oolong {
auto PhotoPathMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> PhotoPathMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for PhotoPath");
  }
  auto path   = duckorm::TakeString(data[1]);
  auto device = duckorm::TakeString(data[2]);
  if (!path || !device) {
    throw std::runtime_error("PhotoPath row without path or device");
  }
  return {duckorm::TakeInt64(data[0]),
          std::move(path),
          std::move(device),
          data[3].index() == 0 ? 0 : duckorm::TakeInt64(data[3]),
          duckorm::TakeString(data[4]),
          duckorm::TakeString(data[5]),
          duckorm::TakeNullableInt64(data[6]),
          duckorm::TakeString(data[7]),
          duckorm::TakeString(data[8])};
}
};  // namespace oolong
