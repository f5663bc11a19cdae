#include "app/convert_service.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "app/inspect_service.hpp"
#include "test_support/temp_dir_fixation.hpp"

namespace oolong {
class ConvertServiceTests : public TempDirTests {};

TEST_F(ConvertServiceTests, ConvertsAndResizes) {
  auto           src = WriteImage("in/photo.png", 800, 600);
  auto           dst = root_ / "out" / "nested" / "photo.jpg";
  ConvertService service(std::make_shared<BackendRegistry>());

  auto           result = service.ConvertImage(src, dst, "400x400", ImageFormatType::JPEG);
  ASSERT_TRUE(result.IsOk()) << result.message_;
  EXPECT_EQ(*result.value_, dst);

  cv::Mat written = Transcoder::DecodeFile(dst);
  ASSERT_FALSE(written.empty());
  EXPECT_EQ(written.cols, 400);
  EXPECT_EQ(written.rows, 300);
  EXPECT_EQ(written.channels(), 3);
}

TEST_F(ConvertServiceTests, InvalidResolutionKeepsOriginalSize) {
  auto           src = WriteImage("in/photo.jpg", 120, 80);
  auto           dst = root_ / "photo.png";
  ConvertService service(nullptr);
  auto           result = service.ConvertImage(src, dst, "huge", ImageFormatType::PNG);
  ASSERT_TRUE(result.IsOk());
  cv::Mat written = Transcoder::DecodeFile(dst);
  EXPECT_EQ(written.cols, 120);
  EXPECT_EQ(written.rows, 80);
}

TEST_F(ConvertServiceTests, MissingSourceIsIoError) {
  ConvertService service(nullptr);
  auto result = service.ConvertImage(root_ / "nope.png", root_ / "out.jpg", std::nullopt,
                                     ImageFormatType::JPEG);
  EXPECT_FALSE(result.IsOk());
  EXPECT_EQ(result.code_, ErrorCode::IO_ERROR);
  EXPECT_FALSE(std::filesystem::exists(root_ / "out.jpg"));
}

TEST_F(ConvertServiceTests, UndecodableSourceIsDecodeError) {
  auto           src = WriteBytes("broken.png", "no pixels here");
  ConvertService service(nullptr);
  auto result = service.ConvertImage(src, root_ / "out.jpg", std::nullopt, ImageFormatType::JPEG);
  EXPECT_EQ(result.code_, ErrorCode::DECODE_ERROR);
}

TEST_F(ConvertServiceTests, ResolvesOutputPaths) {
  std::filesystem::create_directories(root_ / "existing");
  const file_path_t src = "/data/IMG_0001.CR2";
  EXPECT_EQ(ConvertService::ResolveOutputPath(src, std::nullopt, ImageFormatType::JPEG),
            file_path_t("/data/IMG_0001.jpg"));
  EXPECT_EQ(ConvertService::ResolveOutputPath(src, "/tmp/exports/", ImageFormatType::PNG),
            file_path_t("/tmp/exports/IMG_0001.png"));
  EXPECT_EQ(ConvertService::ResolveOutputPath(src, (root_ / "existing").string(),
                                               ImageFormatType::JPEG),
            root_ / "existing" / "IMG_0001.jpg");
  EXPECT_EQ(ConvertService::ResolveOutputPath(src, "/tmp/renamed.tif", ImageFormatType::JPEG),
            file_path_t("/tmp/renamed.jpg"));
  EXPECT_EQ(ConvertService::ResolveOutputPath(src, "/tmp/noext", ImageFormatType::PNG),
            file_path_t("/tmp/noext.png"));
}

class InspectServiceTests : public TempDirTests {};

TEST_F(InspectServiceTests, ReportsFileImageAndExif) {
  auto photo = WriteImage("tagged.jpg", 64, 32);
  WriteExifTags(photo, {{"Exif.Image.Model", "GR III"}});

  InspectService service(std::make_shared<BackendRegistry>());
  auto           report = service.InspectFile(photo);
  EXPECT_EQ(report["file"]["name"], "tagged.jpg");
  EXPECT_EQ(report["file"]["extension"], ".jpg");
  EXPECT_EQ(report["image"]["width"], 64);
  EXPECT_EQ(report["image"]["height"], 32);
  EXPECT_EQ(report["image"]["has_transparency"], false);
  EXPECT_EQ(report["exif"]["Exif.Image.Model"], "GR III");
  EXPECT_TRUE(report["raw"].empty());
}

TEST_F(InspectServiceTests, DetectsTransparency) {
  auto           photo = WriteImage("alpha.png", 8, 8, 0, CV_8UC4);
  InspectService service(nullptr);
  auto           report = service.InspectFile(photo);
  EXPECT_EQ(report["image"]["channels"], 4);
  EXPECT_EQ(report["image"]["has_transparency"], true);
}

TEST_F(InspectServiceTests, MissingFileThrows) {
  InspectService service(nullptr);
  EXPECT_THROW(service.InspectFile(root_ / "missing.jpg"), std::invalid_argument);
}
};  // namespace oolong
