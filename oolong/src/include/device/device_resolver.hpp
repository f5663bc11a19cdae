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

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "device/mount_table.hpp"
#include "type/type.hpp"

namespace oolong {
/**
 * @brief Where the resolver looks for system information. Defaults point at the live
 *        system, tests swap in their own tree.
 */
struct DeviceEnvironment {
  file_path_t                  mount_table_  = "/proc/mounts";
  file_path_t                  by_label_dir_ = "/dev/disk/by-label";
  file_path_t                  by_uuid_dir_  = "/dev/disk/by-uuid";
  std::function<std::string()> hostname_provider_{};
};

struct DeviceLocation {
  device_id_t                device_id_;
  // Relative to mount_point_ on a non-root mount, absolute otherwise
  std::string                storage_path_;
  std::optional<std::string> mount_point_{};
};

class DeviceResolver {
 public:
  DeviceResolver() = default;
  explicit DeviceResolver(DeviceEnvironment env) : env_(std::move(env)) {}

  /**
   * @brief Compute a stable device identifier and the mount-relative storage path of a
   *        file. Never throws, lookup failures fall back to hostname and the absolute path.
   *
   * @param path
   * @return DeviceLocation
   */
  auto        Resolve(const file_path_t& path) const -> DeviceLocation;

  auto        Hostname() const -> std::string;

  static auto SanitizeLabel(std::string_view label) -> std::string;
  static auto IsNetworkFsType(std::string_view fs_type) -> bool;
  // "host:/share" or "//host/share" -> "host"
  static auto ParseNetworkServer(std::string_view device) -> std::optional<std::string>;

  // Canonical absolute form, resolved through the nearest existing ancestor
  static auto CanonicalizeLenient(const file_path_t& path) -> file_path_t;

 private:
  auto              IdentifyDevice(const MountEntry& mount) const -> device_id_t;
  auto              LookupDiskLink(const file_path_t& dir, const std::string& device) const
      -> std::optional<std::string>;

  DeviceEnvironment env_{};
};
};  // namespace oolong
