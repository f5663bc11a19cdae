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

#include <spdlog/spdlog.h>

#include <string_view>

namespace oolong {
// Unknown names map to info
auto ParseLogLevel(std::string_view name) -> spdlog::level::level_enum;

/**
 * @brief Install the "oolong" stderr logger as the spdlog default. Safe to call more than
 *        once, later calls only change the level.
 *
 * @param level
 */
void InitLogging(spdlog::level::level_enum level);
};  // namespace oolong
