#include "hash/content_hasher.hpp"

#include <gtest/gtest.h>

#include <string>

#include "test_support/temp_dir_fixation.hpp"

namespace oolong {
class ContentHasherTests : public TempDirTests {};

TEST_F(ContentHasherTests, IdenticalContentGivesIdenticalDigest) {
  auto a = WriteBytes("a/one.jpg", "same bytes in both files");
  auto b = WriteBytes("b/two.png", "same bytes in both files");

  auto ha = ContentHasher::HashFile(a);
  auto hb = ContentHasher::HashFile(b);
  ASSERT_TRUE(ha.IsOk());
  ASSERT_TRUE(hb.IsOk());
  EXPECT_EQ(*ha.value_, *hb.value_);
  EXPECT_EQ(ha.value_->ToString(), hb.value_->ToString());
}

TEST_F(ContentHasherTests, DigestIs32LowercaseHexCharacters) {
  auto file   = WriteBytes("x.jpg", "abc");
  auto digest = ContentHasher::HashFile(file);
  ASSERT_TRUE(digest.IsOk());
  auto text = digest.value_->ToString();
  ASSERT_EQ(text.size(), 32u);
  for (char c : text) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << text;
  }
  EXPECT_EQ(Hash128::FromString(text), *digest.value_);
}

TEST_F(ContentHasherTests, DigestIsMd5OfFileContent) {
  auto abc = ContentHasher::HashFile(WriteBytes("abc.jpg", "abc"));
  ASSERT_TRUE(abc.IsOk());
  EXPECT_EQ(abc.value_->ToString(), "900150983cd24fb0d6963f7d28e17f72");

  auto empty = ContentHasher::HashFile(WriteBytes("empty.jpg", ""));
  ASSERT_TRUE(empty.IsOk());
  EXPECT_EQ(empty.value_->ToString(), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(ContentHasherTests, StreamingMatchesOneShotAcrossChunkBoundaries) {
  for (size_t size : {size_t{0}, ContentHasher::kChunkSize - 1, ContentHasher::kChunkSize,
                      ContentHasher::kChunkSize + 1, ContentHasher::kChunkSize * 3 + 17}) {
    std::string content(size, '\0');
    for (size_t i = 0; i < size; ++i) content[i] = static_cast<char>(i * 13 % 251);
    auto file   = WriteBytes("chunk_" + std::to_string(size) + ".raw", content);
    auto digest = ContentHasher::HashFile(file);
    ASSERT_TRUE(digest.IsOk()) << size;
    EXPECT_EQ(*digest.value_, Hash128::Compute(content.data(), content.size())) << size;
  }
}

TEST_F(ContentHasherTests, DifferentContentGivesDifferentDigest) {
  auto a = ContentHasher::HashFile(WriteBytes("a.jpg", "first"));
  auto b = ContentHasher::HashFile(WriteBytes("b.jpg", "second"));
  ASSERT_TRUE(a.IsOk() && b.IsOk());
  EXPECT_NE(*a.value_, *b.value_);
}

TEST_F(ContentHasherTests, MissingFileIsHashError) {
  auto digest = ContentHasher::HashFile(root_ / "does_not_exist.jpg");
  EXPECT_FALSE(digest.IsOk());
  EXPECT_EQ(digest.code_, ErrorCode::HASH_ERROR);
  EXPECT_FALSE(digest.message_.empty());
}
};  // namespace oolong
