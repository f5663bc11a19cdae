#include "decoders/backend_registry.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "test_support/temp_dir_fixation.hpp"

namespace oolong {
namespace {
class FakeBackend final : public ImageBackend {
 public:
  FakeBackend(std::string name, bool available) : name_(std::move(name)), available_(available) {}

  auto Name() const -> std::string override { return name_; }
  auto CanProcess(const image_path_t&) const -> bool override { return available_; }
  auto Decode(const image_path_t&, ImageFormatType, const std::optional<Resolution>&)
      -> std::optional<std::vector<uint8_t>> override {
    return std::vector<uint8_t>{1, 2, 3};
  }

 private:
  std::string name_;
  bool        available_;
};
}  // namespace

TEST(BackendRegistryTest, NormalizesExtensions) {
  BackendRegistry registry;
  auto            backend = std::make_shared<FakeBackend>("fake", true);
  registry.Register("NEF", backend);
  registry.Register(".Cr2", backend);

  auto exts = registry.RegisteredExtensions();
  EXPECT_NE(std::find(exts.begin(), exts.end(), ".nef"), exts.end());
  EXPECT_NE(std::find(exts.begin(), exts.end(), ".cr2"), exts.end());
  EXPECT_EQ(registry.GetBackend("/photos/DSC_0001.NEF"), backend);
  EXPECT_EQ(registry.GetBackend("/photos/a.jpg"), nullptr);
}

TEST(BackendRegistryTest, LaterRegistrationReplaces) {
  BackendRegistry registry;
  auto            first  = std::make_shared<FakeBackend>("first", true);
  auto            second = std::make_shared<FakeBackend>("second", true);
  registry.Register(".nef", first);
  registry.Register(".nef", second);
  ASSERT_NE(registry.GetBackend("a.nef"), nullptr);
  EXPECT_EQ(registry.GetBackend("a.nef")->Name(), "second");
  EXPECT_EQ(registry.RegisteredExtensions().size(), 1u);
}

TEST(BackendRegistryTest, UnavailableBackendIsNotReturned) {
  BackendRegistry registry;
  registry.Register(".heic", std::make_shared<FakeBackend>("heif", false));
  EXPECT_EQ(registry.GetBackend("a.heic"), nullptr);
}

TEST(BackendRegistryTest, UnregisterAndInvalidArguments) {
  BackendRegistry registry;
  registry.Register(".nef", std::make_shared<FakeBackend>("fake", true));
  registry.Unregister("NEF");
  EXPECT_TRUE(registry.Empty());
  EXPECT_THROW(registry.Register(".nef", nullptr), std::invalid_argument);
  EXPECT_THROW(registry.Register("  ", std::make_shared<FakeBackend>("fake", true)),
               std::invalid_argument);
}

class LibRawBackendTests : public TempDirTests {};

TEST_F(LibRawBackendTests, DefaultRegistryRejectsNonRawAndMissingFiles) {
  auto registry = BackendRegistry::CreateDefault();
  ASSERT_NE(registry, nullptr);
  EXPECT_EQ(registry->GetBackend(WriteImage("a.jpg", 8, 8)), nullptr);
  EXPECT_EQ(registry->GetBackend(root_ / "missing.nef"), nullptr);
}

TEST_F(LibRawBackendTests, CorruptRawDecodesToNothing) {
  auto registry = BackendRegistry::CreateDefault();
  auto corrupt  = WriteBytes("broken.nef", "this is not a raw file");
  auto backend  = registry->GetBackend(corrupt);
  if (backend == nullptr) {
    GTEST_SKIP() << "LibRaw backend unavailable";
  }
  EXPECT_FALSE(backend->Decode(corrupt, ImageFormatType::JPEG, std::nullopt).has_value());
}
};  // namespace oolong
