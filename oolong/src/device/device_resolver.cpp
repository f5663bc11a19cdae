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

#include "device/device_resolver.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>

#include <array>
#include <filesystem>
#include <format>
#include <system_error>

#include "utils/string/convert.hpp"

namespace oolong {
namespace {
auto SystemHostname() -> std::string {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size() - 1) != 0 || buffer[0] == '\0') {
    return "unknown";
  }
  return std::string(buffer.data());
}

auto MountLeaf(const std::string& mount_point) -> std::string {
  std::string leaf = std::filesystem::path(mount_point).filename().string();
  return leaf.empty() ? mount_point : leaf;
}

auto StripDevPrefix(const std::string& device) -> std::string {
  constexpr std::string_view prefix = "/dev/";
  if (device.compare(0, prefix.size(), prefix) == 0) {
    return device.substr(prefix.size());
  }
  return device;
}
}  // namespace

auto DeviceResolver::Hostname() const -> std::string {
  std::string name = env_.hostname_provider_ ? env_.hostname_provider_() : SystemHostname();
  return name.empty() ? "unknown" : name;
}

auto DeviceResolver::SanitizeLabel(std::string_view label) -> std::string {
  std::string decoded = conv::UrlUnquote(label);
  decoded             = conv::UnescapeHex(decoded);
  decoded             = MountTable::UnescapeOctal(decoded);
  return conv::ToValidUtf8(conv::Trim(decoded));
}

auto DeviceResolver::IsNetworkFsType(std::string_view fs_type) -> bool {
  return fs_type == "nfs" || fs_type == "nfs4" || fs_type == "cifs" || fs_type == "smbfs" ||
         fs_type == "smb3";
}

auto DeviceResolver::ParseNetworkServer(std::string_view device) -> std::optional<std::string> {
  if (device.starts_with("//")) {
    std::string_view rest = device.substr(2);
    size_t           end  = rest.find('/');
    std::string_view host = rest.substr(0, end);
    if (host.empty()) return std::nullopt;
    return std::string(host);
  }
  size_t colon = device.find(':');
  if (colon != std::string_view::npos && colon > 0) {
    return std::string(device.substr(0, colon));
  }
  return std::nullopt;
}

auto DeviceResolver::CanonicalizeLenient(const file_path_t& path) -> file_path_t {
  std::filesystem::path absolute = std::filesystem::absolute(path).lexically_normal();
  std::filesystem::path existing = absolute;
  std::filesystem::path tail;
  std::error_code       ec;
  while (!std::filesystem::exists(existing, ec) && existing.has_relative_path()) {
    tail     = existing.filename() / tail;
    existing = existing.parent_path();
  }
  std::filesystem::path canonical = std::filesystem::canonical(existing, ec);
  if (ec) {
    return absolute;
  }
  return tail.empty() ? canonical : (canonical / tail).lexically_normal();
}

auto DeviceResolver::LookupDiskLink(const file_path_t& dir, const std::string& device) const
    -> std::optional<std::string> {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return std::nullopt;
  }
  const std::string device_node = std::filesystem::path(device).filename().string();
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    std::error_code link_ec;
    auto            target = std::filesystem::read_symlink(entry.path(), link_ec);
    if (link_ec) {
      continue;
    }
    if (target.filename().string() == device_node) {
      return entry.path().filename().string();
    }
  }
  return std::nullopt;
}

auto DeviceResolver::IdentifyDevice(const MountEntry& mount) const -> device_id_t {
  if (mount.device_.starts_with("/dev/")) {
    if (auto label = LookupDiskLink(env_.by_label_dir_, mount.device_)) {
      std::string sanitized = SanitizeLabel(*label);
      if (!sanitized.empty()) {
        return std::format("{} ({})", sanitized, mount.mount_point_);
      }
    }
    if (auto uuid = LookupDiskLink(env_.by_uuid_dir_, mount.device_)) {
      return std::format("{} [{}]", MountLeaf(mount.mount_point_), uuid->substr(0, 8));
    }
  }
  if (IsNetworkFsType(mount.fs_type_)) {
    if (auto server = ParseNetworkServer(mount.device_)) {
      return std::format("{} ({})", *server, mount.mount_point_);
    }
  }
  return std::format("{} ({})", StripDevPrefix(mount.device_), MountLeaf(mount.mount_point_));
}

auto DeviceResolver::Resolve(const file_path_t& path) const -> DeviceLocation {
  DeviceLocation fallback;
  try {
    std::filesystem::path canonical = CanonicalizeLenient(path);
    std::string           canonical_str = conv::EscapeInvalidUtf8(canonical.generic_string());
    fallback                            = {Hostname(), canonical_str, std::nullopt};

    auto table = MountTable::Load(env_.mount_table_);
    if (!table) {
      spdlog::debug("{}: {}", ErrorCodeName(table.code_), table.message_);
      return fallback;
    }
    auto mount = MountTable::FindBestMount(*table.value_, canonical.generic_string());
    if (!mount || mount->mount_point_ == "/") {
      return fallback;
    }

    DeviceLocation location;
    location.device_id_   = conv::ToValidUtf8(IdentifyDevice(*mount));
    location.storage_path_ = conv::EscapeInvalidUtf8(
        canonical.lexically_relative(mount->mount_point_).generic_string());
    location.mount_point_ = mount->mount_point_;
    if (location.storage_path_.empty()) {
      location.storage_path_ = ".";
    }
    return location;
  } catch (const std::exception& e) {
    spdlog::debug("{}: device lookup for '{}' failed: {}",
                  ErrorCodeName(ErrorCode::MOUNT_RESOLUTION_ERROR), path.string(), e.what());
    if (fallback.device_id_.empty()) {
      fallback = {Hostname(), conv::EscapeInvalidUtf8(path.generic_string()), std::nullopt};
    }
    return fallback;
  }
}
};  // namespace oolong
