#include "device/device_resolver.hpp"

#include <gtest/gtest.h>

#include <filesystem>

#include "device_test_fixation.hpp"

namespace oolong {
TEST_F(DeviceResolverTests, NestedMountResolvesAgainstLongestPrefix) {
  WriteMounts("/dev/sda1 / ext4 rw 0 0\n"
              "/dev/sdb1 " + data_mount_.string() + " ext4 rw 0 0\n"
              "/dev/sdc1 " + sub_mount_.string() + " ext4 rw 0 0\n");
  auto photo    = WriteBytes("mnt/data/sub/photo.jpg", "x");

  auto location = MakeResolver().Resolve(photo);
  ASSERT_TRUE(location.mount_point_.has_value());
  EXPECT_EQ(*location.mount_point_, sub_mount_.string());
  EXPECT_EQ(location.storage_path_, "photo.jpg");
  EXPECT_EQ(location.device_id_, "sdc1 (sub)");

  auto outer = MakeResolver().Resolve(WriteBytes("mnt/data/other/a.jpg", "y"));
  EXPECT_EQ(outer.storage_path_, "other/a.jpg");
  EXPECT_EQ(outer.device_id_, "sdb1 (data)");
}

TEST_F(DeviceResolverTests, RootMountUsesHostnameAndAbsolutePath) {
  WriteMounts("/dev/sda1 / ext4 rw 0 0\n");
  auto photo    = WriteBytes("pics/a.jpg", "x");
  auto location = MakeResolver().Resolve(photo);
  EXPECT_EQ(location.device_id_, "test-host");
  EXPECT_EQ(location.storage_path_, photo.generic_string());
  EXPECT_FALSE(location.mount_point_.has_value());
}

TEST_F(DeviceResolverTests, MissingMountTableFallsBackToHostname) {
  auto photo    = WriteBytes("a.jpg", "x");
  auto location = MakeResolver().Resolve(photo);
  EXPECT_EQ(location.device_id_, "test-host");
  EXPECT_EQ(location.storage_path_, photo.generic_string());
}

TEST_F(DeviceResolverTests, LabelTakesPrecedenceAndIsSanitized) {
  WriteMounts("/dev/sdb1 " + data_mount_.string() + " vfat rw 0 0\n");
  std::filesystem::create_symlink("../../sdb1", by_label_ / "My\\x20Card");
  std::filesystem::create_symlink("../../sdb1", by_uuid_ / "1234abcd-5678-90ef");

  auto location = MakeResolver().Resolve(WriteBytes("mnt/data/DCIM/a.jpg", "x"));
  EXPECT_EQ(location.device_id_, "My Card (" + data_mount_.string() + ")");
  EXPECT_EQ(location.storage_path_, "DCIM/a.jpg");
}

TEST_F(DeviceResolverTests, UuidIsAbbreviatedWithMountLeaf) {
  WriteMounts("/dev/sdb1 " + data_mount_.string() + " ext4 rw 0 0\n");
  std::filesystem::create_symlink("../../sdb1", by_uuid_ / "1234abcd-5678-90ef");
  std::filesystem::create_symlink("../../sdz9", by_label_ / "OTHER");

  auto location = MakeResolver().Resolve(WriteBytes("mnt/data/a.jpg", "x"));
  EXPECT_EQ(location.device_id_, "data [1234abcd]");
}

TEST_F(DeviceResolverTests, NetworkShareUsesServerName) {
  WriteMounts("nas.local:/volume1/photos " + data_mount_.string() + " nfs4 rw 0 0\n");
  auto location = MakeResolver().Resolve(WriteBytes("mnt/data/2020/a.jpg", "x"));
  EXPECT_EQ(location.device_id_, "nas.local (" + data_mount_.string() + ")");
  EXPECT_EQ(location.storage_path_, "2020/a.jpg");
}

TEST_F(DeviceResolverTests, NonexistentFileResolvesThroughNearestAncestor) {
  WriteMounts("/dev/sdb1 " + data_mount_.string() + " ext4 rw 0 0\n");
  auto location = MakeResolver().Resolve(data_mount_ / "not" / "yet" / "here.jpg");
  EXPECT_EQ(location.storage_path_, "not/yet/here.jpg");
  EXPECT_EQ(location.device_id_, "sdb1 (data)");
}

TEST(DeviceResolverStaticTest, SanitizeLabelUndoesAllEscapes) {
  EXPECT_EQ(DeviceResolver::SanitizeLabel("My%20Disk"), "My Disk");
  EXPECT_EQ(DeviceResolver::SanitizeLabel("My\\x20Disk"), "My Disk");
  EXPECT_EQ(DeviceResolver::SanitizeLabel("My\\040Disk"), "My Disk");
  EXPECT_EQ(DeviceResolver::SanitizeLabel("  CARD  "), "CARD");
}

TEST(DeviceResolverStaticTest, ParsesNetworkServers) {
  EXPECT_EQ(DeviceResolver::ParseNetworkServer("host:/share"), "host");
  EXPECT_EQ(DeviceResolver::ParseNetworkServer("//fileserver/photos"), "fileserver");
  EXPECT_FALSE(DeviceResolver::ParseNetworkServer("/dev/sda1").has_value());
  EXPECT_TRUE(DeviceResolver::IsNetworkFsType("cifs"));
  EXPECT_FALSE(DeviceResolver::IsNetworkFsType("ext4"));
}
};  // namespace oolong
