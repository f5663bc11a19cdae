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

#include "hash/content_hasher.hpp"

#include <spdlog/spdlog.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <memory>

namespace oolong {
namespace {
struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
}  // namespace

auto ContentHasher::HashFile(const file_path_t& file) -> StageResult<Hash128> {
  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) {
    return StageResult<Hash128>::Fail(ErrorCode::HASH_ERROR,
                                      std::format("Cannot open '{}' for hashing", file.string()));
  }

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    return StageResult<Hash128>::Fail(ErrorCode::HASH_ERROR, "Cannot initialize hash state");
  }

  std::array<char, kChunkSize> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = in.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
      return StageResult<Hash128>::Fail(ErrorCode::HASH_ERROR,
                                        std::format("Hash update failed for '{}'", file.string()));
    }
  }
  if (in.bad()) {
    return StageResult<Hash128>::Fail(ErrorCode::HASH_ERROR,
                                      std::format("I/O error while reading '{}'", file.string()));
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int                                md_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1 || md_len != Hash128::kDigestSize) {
    return StageResult<Hash128>::Fail(ErrorCode::HASH_ERROR,
                                      std::format("Hash finalization failed for '{}'", file.string()));
  }
  std::array<unsigned char, Hash128::kDigestSize> bytes{};
  std::copy_n(md.begin(), Hash128::kDigestSize, bytes.begin());
  Hash128 digest = Hash128::FromDigest(bytes);
  spdlog::debug("Hashed '{}' -> {}", file.string(), digest.ToString());
  return StageResult<Hash128>::Ok(digest);
}
};  // namespace oolong
