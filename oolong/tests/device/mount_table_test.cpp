#include "device/mount_table.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace oolong {
TEST(MountTableTest, ParsesProcMountsFormat) {
  std::istringstream in(
      "# comment line\n"
      "/dev/sda1 / ext4 rw,relatime 0 0\n"
      "\n"
      "broken-line\n"
      "/dev/sdb1 /media/user/My\\040Disk vfat rw 0 0\n"
      "server:/export /mnt/nfs/ nfs4 rw 0 0\n");
  auto entries = MountTable::Parse(in);
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].device_, "/dev/sda1");
  EXPECT_EQ(entries[0].mount_point_, "/");
  EXPECT_EQ(entries[1].mount_point_, "/media/user/My Disk");
  EXPECT_EQ(entries[1].fs_type_, "vfat");
  EXPECT_EQ(entries[2].mount_point_, "/mnt/nfs");
  EXPECT_EQ(entries[2].fs_type_, "nfs4");
}

TEST(MountTableTest, UnescapesOctalSequencesOnly) {
  EXPECT_EQ(MountTable::UnescapeOctal("a\\040b"), "a b");
  EXPECT_EQ(MountTable::UnescapeOctal("tab\\011end"), "tab\tend");
  EXPECT_EQ(MountTable::UnescapeOctal("back\\134slash"), "back\\slash");
  EXPECT_EQ(MountTable::UnescapeOctal("short\\04"), "short\\04");
  EXPECT_EQ(MountTable::UnescapeOctal("not\\089"), "not\\089");
  EXPECT_EQ(MountTable::UnescapeOctal("\\040"), " ");
}

TEST(MountTableTest, LongestPrefixWins) {
  std::vector<MountEntry> entries = {{"/dev/sda1", "/", "ext4"},
                                     {"/dev/sdb1", "/mnt/data/sub", "ext4"},
                                     {"/dev/sdc1", "/mnt/data", "ext4"}};
  auto                    best = MountTable::FindBestMount(entries, "/mnt/data/sub/photo.jpg");
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->mount_point_, "/mnt/data/sub");

  best = MountTable::FindBestMount(entries, "/mnt/data/other/photo.jpg");
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->mount_point_, "/mnt/data");

  best = MountTable::FindBestMount(entries, "/home/user/photo.jpg");
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->mount_point_, "/");
}

TEST(MountTableTest, PrefixMatchRespectsComponentBoundaries) {
  std::vector<MountEntry> entries = {{"/dev/sda1", "/", "ext4"},
                                     {"/dev/sdb1", "/mnt/data", "ext4"}};
  auto                    best = MountTable::FindBestMount(entries, "/mnt/database/a.jpg");
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->mount_point_, "/");
}

TEST(MountTableTest, LaterEntryShadowsSameMountPoint) {
  std::vector<MountEntry> entries = {{"/dev/sdb1", "/mnt/usb", "ext4"},
                                     {"/dev/sdc1", "/mnt/usb", "vfat"}};
  auto                    best = MountTable::FindBestMount(entries, "/mnt/usb/a.jpg");
  ASSERT_TRUE(best.has_value());
  EXPECT_EQ(best->device_, "/dev/sdc1");
}

TEST(MountTableTest, MissingTableIsMountResolutionError) {
  auto table = MountTable::Load("/nonexistent/oolong/mounts");
  EXPECT_FALSE(table.IsOk());
  EXPECT_EQ(table.code_, ErrorCode::MOUNT_RESOLUTION_ERROR);
}
};  // namespace oolong
