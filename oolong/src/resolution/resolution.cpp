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

#include "resolution/resolution.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <regex>

#include "utils/string/convert.hpp"

namespace oolong {
namespace {
auto ParsePositive(const std::string& digits) -> std::optional<uint32_t> {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}
}  // namespace

auto Resolution::ToString() const -> std::string { return std::format("{}x{}", width_, height_); }

auto ResolutionResolver::Presets() -> const std::map<std::string, Resolution>& {
  static const std::map<std::string, Resolution> presets = {
      {"xsmall", {320, 240}},           {"low", {640, 480}},
      {"small", {640, 480}},            {"240p", {426, 240}},
      {"360p", {640, 360}},             {"480p", {854, 480}},
      {"720p", {1280, 720}},            {"hd", {1280, 720}},
      {"medium", {1920, 1080}},         {"1080p", {1920, 1080}},
      {"fhd", {1920, 1080}},            {"landscape", {1920, 1080}},
      {"1440p", {2560, 1440}},          {"qhd", {2560, 1440}},
      {"high", {3840, 2160}},           {"large", {3840, 2160}},
      {"4k", {3840, 2160}},             {"2160p", {3840, 2160}},
      {"xlarge", {7680, 4320}},         {"8k", {7680, 4320}},
      {"square", {1080, 1080}},         {"instagram", {1080, 1080}},
      {"portrait", {1080, 1920}},       {"instagram-story", {1080, 1920}},
  };
  return presets;
}

auto ResolutionResolver::SortedPresets() -> std::vector<std::pair<std::string, Resolution>> {
  std::vector<std::pair<std::string, Resolution>> sorted(Presets().begin(), Presets().end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
    uint64_t pa = static_cast<uint64_t>(a.second.width_) * a.second.height_;
    uint64_t pb = static_cast<uint64_t>(b.second.width_) * b.second.height_;
    return pa < pb;
  });
  return sorted;
}

auto ResolutionResolver::Parse(std::string_view value) -> std::optional<Resolution> {
  std::string normalized = conv::ToLower(conv::Trim(value));
  if (normalized.empty()) {
    return std::nullopt;
  }

  auto preset = Presets().find(normalized);
  if (preset != Presets().end()) {
    return preset->second;
  }

  static const std::regex pattern(R"(^(\d+)\s*x\s*(\d+)$)");
  std::smatch             match;
  if (!std::regex_match(normalized, match, pattern)) {
    return std::nullopt;
  }
  auto width  = ParsePositive(match[1].str());
  auto height = ParsePositive(match[2].str());
  if (!width || !height) {
    return std::nullopt;
  }
  return Resolution{*width, *height};
}
};  // namespace oolong
