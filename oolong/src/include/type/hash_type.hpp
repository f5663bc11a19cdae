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

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace oolong {
/**
 * @brief 128-bit MD5 content digest. The textual form is 32 lowercase hex characters
 *        in digest byte order.
 */
class Hash128 {
 public:
  static constexpr size_t kDigestSize = 16;

  Hash128() : high_(0), low_(0) {}
  Hash128(uint64_t low, uint64_t high) : high_(high), low_(low) {}

  /**
   * @brief Build from raw digest bytes, big-endian halves.
   */
  static Hash128 FromDigest(const std::array<unsigned char, kDigestSize>& bytes) {
    uint64_t high = 0;
    uint64_t low  = 0;
    for (size_t i = 0; i < 8; ++i) {
      high = (high << 8) | bytes[i];
      low  = (low << 8) | bytes[i + 8];
    }
    return Hash128(low, high);
  }

  uint64_t    low64() const { return low_; }
  uint64_t    high64() const { return high_; }

  std::string ToString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(16) << high_;
    oss << std::setw(16) << low_;
    return oss.str();
  }

  static Hash128 FromString(const std::string& str) {
    if (str.length() != 32) {
      throw std::invalid_argument("Hash128::FromString: Invalid string length");
    }
    uint64_t high = std::stoull(str.substr(0, 16), nullptr, 16);
    uint64_t low  = std::stoull(str.substr(16, 16), nullptr, 16);
    return Hash128(low, high);
  }

  bool operator==(const Hash128& other) const noexcept {
    return low_ == other.low_ && high_ == other.high_;
  }
  bool operator!=(const Hash128& other) const noexcept { return !(*this == other); }

  static Hash128 Compute(const void* data, size_t length) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int                                md_len = 0;
    if (EVP_Digest(data, length, md.data(), &md_len, EVP_md5(), nullptr) != 1 ||
        md_len != kDigestSize) {
      throw std::runtime_error("Hash128::Compute: MD5 digest failed");
    }
    std::array<unsigned char, kDigestSize> bytes{};
    std::copy_n(md.begin(), kDigestSize, bytes.begin());
    return FromDigest(bytes);
  }

 private:
  uint64_t high_;
  uint64_t low_;
};
};  // namespace oolong

namespace std {
template <>
struct hash<oolong::Hash128> {
  std::size_t operator()(const oolong::Hash128& h) const noexcept {
    auto h1 = std::hash<uint64_t>{}(h.low64());
    auto h2 = std::hash<uint64_t>{}(h.high64());
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};
}  // namespace std
