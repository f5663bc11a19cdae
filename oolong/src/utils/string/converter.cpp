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

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>

#include "utils/string/convert.hpp"

namespace conv {
namespace {
auto HexValue(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}  // namespace

auto ToValidUtf8(std::string_view bytes) -> std::string {
  std::string out;
  utf8::replace_invalid(bytes.begin(), bytes.end(), std::back_inserter(out));
  return out;
}

auto EscapeInvalidUtf8(std::string_view bytes) -> std::string {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(bytes.size());
  auto append_valid = [&out](std::string_view::const_iterator begin,
                             std::string_view::const_iterator end) {
    for (auto it = begin; it != end; ++it) {
      if (*it == '%') {
        out += "%25";
      } else {
        out.push_back(*it);
      }
    }
  };

  auto it = bytes.begin();
  while (it != bytes.end()) {
    auto invalid = utf8::find_invalid(it, bytes.end());
    append_valid(it, invalid);
    if (invalid == bytes.end()) break;
    auto byte = static_cast<unsigned char>(*invalid);
    out.push_back('%');
    out.push_back(kHex[byte >> 4]);
    out.push_back(kHex[byte & 0x0F]);
    it = invalid + 1;
  }
  return out;
}

auto UrlUnquote(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size() && HexValue(value[i + 1]) >= 0 &&
        HexValue(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(value[i + 1]) * 16 + HexValue(value[i + 2])));
      i += 2;
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

auto UnescapeHex(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 3 < value.size() && value[i + 1] == 'x' &&
        HexValue(value[i + 2]) >= 0 && HexValue(value[i + 3]) >= 0) {
      out.push_back(static_cast<char>(HexValue(value[i + 2]) * 16 + HexValue(value[i + 3])));
      i += 3;
      continue;
    }
    out.push_back(value[i]);
  }
  return out;
}

auto Trim(std::string_view value) -> std::string {
  size_t begin = 0;
  size_t end   = value.size();
  while (begin < end && (value[begin] == '\0' ||
                         std::isspace(static_cast<unsigned char>(value[begin])))) {
    ++begin;
  }
  while (end > begin &&
         (value[end - 1] == '\0' || std::isspace(static_cast<unsigned char>(value[end - 1])))) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

auto ToLower(std::string_view value) -> std::string {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}
};  // namespace conv
