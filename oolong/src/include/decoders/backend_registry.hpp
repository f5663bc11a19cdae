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

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "decoders/image_backend.hpp"
#include "type/type.hpp"

namespace oolong {
/**
 * @brief Extension-keyed table of backends. One backend per lowercase extension, a later
 *        registration for the same extension replaces the earlier one.
 */
class BackendRegistry {
 public:
  void Register(const std::string& extension, std::shared_ptr<ImageBackend> backend);
  void Unregister(const std::string& extension);

  /**
   * @brief Look up the backend for a file.
   *
   * @param path
   * @return std::shared_ptr<ImageBackend> nullptr when no backend is registered for the
   *         extension or the registered backend cannot process the file
   */
  auto GetBackend(const image_path_t& path) const -> std::shared_ptr<ImageBackend>;

  auto RegisteredExtensions() const -> std::vector<std::string>;
  auto Empty() const -> bool { return backends_.empty(); }

  // LibRaw registered for every RAW extension
  static auto CreateDefault() -> std::shared_ptr<BackendRegistry>;

 private:
  std::map<std::string, std::shared_ptr<ImageBackend>> backends_;
};
};  // namespace oolong
