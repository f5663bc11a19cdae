#pragma once

#include <gtest/gtest.h>
#include <unistd.h>

#include <exiv2/exiv2.hpp>
#include <filesystem>
#include <fstream>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <vector>

#include "utils/log/logging.hpp"

namespace oolong {
/**
 * @brief Base fixture owning a fresh temporary directory per test. Logging and Exiv2
 *        warnings are silenced.
 */
class TempDirTests : public ::testing::Test {
 protected:
  std::filesystem::path root_;

  // Run before any unit test runs
  void                  SetUp() override {
    InitLogging(spdlog::level::off);
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::Level::mute);
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_            = std::filesystem::temp_directory_path() /
            (std::string("oolong_") + info->test_suite_name() + "_" + info->name() + "_" +
             std::to_string(::getpid()));
    std::filesystem::remove_all(root_);
    std::filesystem::create_directories(root_);
    root_ = std::filesystem::canonical(root_);
  }

  // Run after each unit test
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  auto WriteBytes(const std::filesystem::path& relative, const std::string& bytes)
      -> std::filesystem::path {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << bytes;
    return path;
  }

  // Synthetic image: a gradient so that different seeds give different bytes
  auto WriteImage(const std::filesystem::path& relative, int width, int height, int seed = 0,
                  int type = CV_8UC3) -> std::filesystem::path {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());
    cv::Mat img(height, width, type);
    for (int y = 0; y < height; ++y) {
      for (int x = 0; x < width; ++x) {
        for (int c = 0; c < img.channels(); ++c) {
          img.ptr<uint8_t>(y)[x * img.channels() + c] =
              static_cast<uint8_t>((x * 7 + y * 3 + c * 50 + seed * 31) % 256);
        }
      }
    }
    EXPECT_TRUE(cv::imwrite(path.string(), img));
    return path;
  }

  static void WriteExifTags(const std::filesystem::path&                              path,
                            const std::vector<std::pair<std::string, std::string>>& tags) {
    auto image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    Exiv2::ExifData& exif = image->exifData();
    for (const auto& [key, value] : tags) {
      exif[key] = value;
    }
    image->writeMetadata();
  }
};
};  // namespace oolong
