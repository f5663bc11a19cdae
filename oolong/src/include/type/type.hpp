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
#include <filesystem>
#include <string>

namespace oolong {

// Source files and directories handed to the pipeline
#define image_path_t    std::filesystem::path
#define file_path_t     std::filesystem::path

// Catalog record ids
#define photograph_id_t int64_t
#define photo_path_id_t int64_t

// Device identifier of a volume, e.g. "CAMERA (/media/usb)"
#define device_id_t     std::string

};  // namespace oolong
