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

#include "decoders/backend_registry.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "decoders/raw_backend.hpp"
#include "type/supported_file_type.hpp"
#include "utils/string/convert.hpp"

namespace oolong {
namespace {
auto NormalizeExtension(const std::string& extension) -> std::string {
  std::string ext = conv::ToLower(conv::Trim(extension));
  if (ext.empty()) {
    throw std::invalid_argument("BackendRegistry: extension must not be empty");
  }
  if (ext[0] != '.') {
    ext.insert(ext.begin(), '.');
  }
  return ext;
}
}  // namespace

void BackendRegistry::Register(const std::string& extension,
                               std::shared_ptr<ImageBackend> backend) {
  if (!backend) {
    throw std::invalid_argument("BackendRegistry: backend must not be null");
  }
  std::string ext = NormalizeExtension(extension);
  auto        it  = backends_.find(ext);
  if (it != backends_.end() && it->second != backend) {
    spdlog::debug("BackendRegistry: '{}' replaces '{}' for {}", backend->Name(),
                  it->second->Name(), ext);
  }
  backends_[ext] = std::move(backend);
}

void BackendRegistry::Unregister(const std::string& extension) {
  backends_.erase(NormalizeExtension(extension));
}

auto BackendRegistry::GetBackend(const image_path_t& path) const
    -> std::shared_ptr<ImageBackend> {
  auto it = backends_.find(LowercaseExtension(path));
  if (it == backends_.end()) {
    return nullptr;
  }
  if (!it->second->CanProcess(path)) {
    return nullptr;
  }
  return it->second;
}

auto BackendRegistry::RegisteredExtensions() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(backends_.size());
  for (const auto& [ext, _] : backends_) {
    out.push_back(ext);
  }
  return out;
}

auto BackendRegistry::CreateDefault() -> std::shared_ptr<BackendRegistry> {
  auto registry = std::make_shared<BackendRegistry>();
  if (!LibRawBackend::IsAvailable()) {
    spdlog::warn("LibRaw reports no supported cameras, RAW files fall back to generic decode");
    return registry;
  }
  auto libraw = std::make_shared<LibRawBackend>();
  for (const auto& ext : raw_extensions) {
    registry->Register(ext, libraw);
  }
  return registry;
}
};  // namespace oolong
