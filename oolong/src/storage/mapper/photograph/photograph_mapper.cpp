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

#include "storage/mapper/photograph/photograph_mapper.hpp"

#include <stdexcept>

namespace oolong {
auto PhotographMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> PhotographMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Photograph");
  }
  return {duckorm::TakeInt64(data[0]),   duckorm::TakeString(data[1]),
          duckorm::TakeString(data[2]),  duckorm::TakeString(data[3]),
          duckorm::TakeString(data[4]),  duckorm::TakeBool(data[5]),
          duckorm::TakeString(data[6]),  duckorm::TakeString(data[7])};
}
};  // namespace oolong
