#include "config/app_config.hpp"

#include <gtest/gtest.h>
#include <stdlib.h>

#include <fstream>
#include <stdexcept>

#include "test_support/temp_dir_fixation.hpp"

namespace oolong {
class AppConfigTests : public TempDirTests {
 protected:
  void SetUp() override {
    TempDirTests::SetUp();
    unsetenv(AppConfig::kEnvVariable);
  }

  void TearDown() override {
    unsetenv(AppConfig::kEnvVariable);
    TempDirTests::TearDown();
  }
};

TEST_F(AppConfigTests, DefaultsApplyForMissingKeys) {
  auto config = AppConfig::FromJson(nlohmann::json::object());
  EXPECT_EQ(config.catalog_path_, file_path_t("oolong_catalog.duckdb"));
  EXPECT_EQ(config.media_root_, file_path_t("oolong_media"));
  EXPECT_EQ(config.log_level_, "info");
  EXPECT_EQ(config.output_format_, ImageFormatType::JPEG);
}

TEST_F(AppConfigTests, ReadsKnownKeys) {
  auto config = AppConfig::FromJson({{"catalog_path", "/srv/catalog.duckdb"},
                                     {"media_root", "/srv/media"},
                                     {"log_level", "debug"},
                                     {"output_format", "png"},
                                     {"unrelated", 42}});
  EXPECT_EQ(config.catalog_path_, file_path_t("/srv/catalog.duckdb"));
  EXPECT_EQ(config.media_root_, file_path_t("/srv/media"));
  EXPECT_EQ(config.log_level_, "debug");
  EXPECT_EQ(config.output_format_, ImageFormatType::PNG);
}

TEST_F(AppConfigTests, RejectsBadValues) {
  EXPECT_THROW(AppConfig::FromJson({{"catalog_path", 3}}), std::invalid_argument);
  EXPECT_THROW(AppConfig::FromJson({{"output_format", "webp"}}), std::invalid_argument);
  EXPECT_THROW(AppConfig::FromJson(nlohmann::json::array()), std::invalid_argument);
}

TEST_F(AppConfigTests, SaveThenLoad) {
  AppConfig config;
  config.catalog_path_  = root_ / "cat.duckdb";
  config.output_format_ = ImageFormatType::PNG;
  config.Save(root_ / "conf" / "oolong.json");

  auto loaded = AppConfig::Load(root_ / "conf" / "oolong.json");
  EXPECT_EQ(loaded.catalog_path_, config.catalog_path_);
  EXPECT_EQ(loaded.output_format_, ImageFormatType::PNG);
}

TEST_F(AppConfigTests, LoadFailuresAreRuntimeErrors) {
  EXPECT_THROW(AppConfig::Load(root_ / "missing.json"), std::runtime_error);
  auto broken = WriteBytes("broken.json", "{ not json");
  EXPECT_THROW(AppConfig::Load(broken), std::runtime_error);
}

TEST_F(AppConfigTests, ResolvesExplicitPathThenEnvironment) {
  auto env_file = WriteBytes("env.json", R"({"log_level": "warn"})");
  setenv(AppConfig::kEnvVariable, env_file.c_str(), 1);

  EXPECT_EQ(AppConfig::ResolveConfigPath(root_ / "explicit.json"), root_ / "explicit.json");
  EXPECT_EQ(AppConfig::ResolveConfigPath(std::nullopt), env_file);
  EXPECT_EQ(AppConfig::LoadResolved(std::nullopt).log_level_, "warn");
}
};  // namespace oolong
